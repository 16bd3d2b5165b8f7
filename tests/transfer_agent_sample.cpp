#include "file_transfer_agent.hpp"
#include "log.hpp"
#include "transfer_command.hpp"
#include "transfer_session.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "transfer_agent_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "local", ec);
  fs::create_directories(base / "stage", ec);
  fs::create_directories(base / "download", ec);

  for(int i = 0; i < 3; ++i) {
    std::ofstream out(base / "local" / ("report_" + std::to_string(i) + ".csv"));
    for(int row = 0; row < 200; ++row) out << i << "," << row << ",sample\n";
  }

  init(false);

  // PUT: the command document is what the server would answer for the statement.
  nlohmann::json put_doc = {
    {"command", "UPLOAD"},
    {"src_locations", {(base / "local" / "*.csv").string()}},
    {"stageInfo", {{"locationType", "LOCAL_FS"}, {"location", (base / "stage").string()}}},
    {"parallel", 2},
    {"autoCompress", true}
  };
  auto put_file = base / "put.json";
  std::ofstream(put_file) << put_doc.dump(2);

  FileTransferAgent::Options options;
  options.executor.temp_root = base;
  auto put_session = std::make_shared<CommandFileSession>(put_file);
  FileTransferAgent put("PUT file://" + (base / "local" / "*.csv").string() + " @~",
                        load_transfer_command(put_file), put_session, options);
  put.execute();
  std::cout << render_text(put.result()) << "\n";

  // GET everything that landed on the stage.
  nlohmann::json names = nlohmann::json::array();
  nlohmann::json materials = nlohmann::json::array();
  for(const auto& row : put.result().rows) {
    names.push_back(row.dest_file_name);
    materials.push_back(nullptr);
  }
  nlohmann::json get_doc = {
    {"command", "DOWNLOAD"},
    {"src_locations", names},
    {"stageInfo", {{"locationType", "LOCAL_FS"}, {"location", (base / "stage").string()}}},
    {"localLocation", (base / "download").string()},
    {"encryptionMaterial", materials}
  };
  auto get_file = base / "get.json";
  std::ofstream(get_file) << get_doc.dump(2);

  auto get_session = std::make_shared<CommandFileSession>(get_file);
  FileTransferAgent get("GET @~ file://" + (base / "download").string(),
                        load_transfer_command(get_file), get_session, options);
  get.execute();
  std::cout << to_json(get.result()).dump(2) << "\n";

  fs::remove_all(base, ec);
  return 0;
}
