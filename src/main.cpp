#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "file_transfer_agent.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "transfer_command.hpp"
#include "transfer_error.hpp"
#include "transfer_session.hpp"

namespace {

// Stand-in statement text when none is given; renewal only needs the file:// token.
std::string default_query(const TransferCommand& command) {
  if(command.kind == CommandKind::Upload) {
    std::string src = command.src_locations.empty() ? std::string() : command.src_locations.front();
    return "PUT file://" + src + " @~";
  }
  return "GET @~ file://" + command.local_location;
}

bool row_succeeded(const ResultRow& row) {
  return row.status == to_string(ResultStatus::Uploaded) ||
         row.status == to_string(ResultStatus::Downloaded) ||
         row.status == to_string(ResultStatus::Skipped);
}

FileTransferAgent::Options agent_options(const SettingsManager& settings) {
  FileTransferAgent::Options options;
  options.home_dir = settings.get<std::string>("home_dir");
  options.parallel_override = settings.get<int>("parallel_override");
  options.executor.temp_root = settings.get<std::string>("temp_root");
  if(options.executor.temp_root.empty()) options.executor.temp_root = std::filesystem::temp_directory_path();
  options.executor.max_retries = std::max(0, settings.get<int>("max_retries"));
  options.executor.retry_backoff = std::chrono::milliseconds(std::max(0, settings.get<int>("retry_backoff_ms")));
  options.executor.retry_backoff_max = std::chrono::milliseconds(std::max(0, settings.get<int>("retry_backoff_max_ms")));
  options.executor.max_renewals = std::max(0, settings.get<int>("max_renewals"));
  return options;
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? std::filesystem::path(argv[0]).filename().string() : "stagexfer");
    try {
      parser.parse(argc, argv, settings);
    } catch(const CommandLineError& e) {
      print_err("{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    Logger logger("stagexfer");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger.error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    std::string command_file = settings.get<std::string>("command_file");
    if(command_file.empty()) {
      print_err("missing command file");
      parser.usage();
      return 1;
    }

    TransferCommand command = load_transfer_command(command_file);
    std::string query = settings.get<std::string>("query");
    if(query.empty()) query = default_query(command);

    auto session = std::make_shared<CommandFileSession>(command_file);
    FileTransferAgent agent(query, std::move(command), session, agent_options(settings));
    agent.execute();

    const ResultTable& table = agent.result();
    if(SettingsManager::to_lower(settings.get<std::string>("output")) == "json") {
      print_out("{}", to_json(table).dump(2));
    } else {
      print_out("{}", render_text(table));
    }

    bool all_ok = std::all_of(table.rows.begin(), table.rows.end(), row_succeeded);
    return all_ok ? 0 : 2;
  } catch(const TransferError& e) {
    init(false);
    Logger logger("stagexfer");
    logger.error("Transfer failed ({}): {}", e.code_name(), e.what());
    cpptrace::generate_trace().print();
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("stagexfer");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
