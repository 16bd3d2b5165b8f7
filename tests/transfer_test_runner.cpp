#include "file_transfer_agent.hpp"
#include "test_runner_utils.hpp"
#include "transfer_error.hpp"
#include "log.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TestContext {
  stage::test::LogCapture& logs;
  bool verbose = false;
};

template<typename Fn>
bool throws_code(Fn&& fn, TransferErrorCode expected) {
  try {
    fn();
  } catch(const TransferError& e) {
    return e.code() == expected;
  }
  return false;
}

bool dir_is_empty(const fs::path& dir) {
  std::error_code ec;
  return fs::is_directory(dir, ec) && fs::directory_iterator(dir, ec) == fs::directory_iterator();
}

FileTransferAgent::Options fast_options(const fs::path& temp_root) {
  FileTransferAgent::Options options;
  options.executor.temp_root = temp_root;
  options.executor.max_retries = 3;
  options.executor.retry_backoff = 1ms;
  options.executor.retry_backoff_max = 4ms;
  options.executor.max_renewals = 3;
  return options;
}

TransferCommand local_put(const fs::path& pattern, const fs::path& stage_dir) {
  TransferCommand command;
  command.kind = CommandKind::Upload;
  command.src_locations = {pattern.string()};
  command.stage_info.location_type = kLocalFsLocationType;
  command.stage_info.location = stage_dir.string();
  command.threshold = 64 * 1024 * 1024;
  command.parallel = 4;
  return command;
}

TransferCommand remote_put(const fs::path& pattern, const std::string& location_type, const std::string& token) {
  TransferCommand command;
  command.kind = CommandKind::Upload;
  command.src_locations = {pattern.string()};
  command.stage_info = stage::test::remote_stage(location_type, token);
  command.threshold = 64 * 1024 * 1024;
  command.parallel = 4;
  return command;
}

std::string put_query(const fs::path& pattern) {
  return "PUT file://" + pattern.string() + " @~";
}

bool test_local_put_single_file(TestContext& ctx) {
  stage::test::Workspace ws("stagexfer_transfer_local_put");
  const std::string content = stage::test::make_payload(100);
  auto source = stage::test::write_file(ws.root() / "in" / "data.csv", content);
  auto stage_dir = ws.dir("stage");
  auto tmp = ws.dir("tmp");

  TransferCommand command = local_put(source, stage_dir);
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(source), command, session, fast_options(tmp));
  ctx.logs.attach(agent.logger());
  agent.execute();

  const auto& table = agent.result();
  if(table.rows.size() != 1) return false;
  const auto& row = table.rows[0];
  bool ok = row.src_file_name == "data.csv" && row.dest_file_name == "data.csv.gz";
  ok = ok && row.status == "UPLOADED" && row.src_file_size == 100 && row.dest_file_size > 0;
  ok = ok && row.source_compression == "NONE" && row.target_compression == "GZIP";
  ok = ok && agent.records()[0].parallel == 1;
  ok = ok && stage::test::gunzip_file(stage_dir / "data.csv.gz") == content;
  ok = ok && dir_is_empty(tmp) && session->calls() == 0;
  ctx.logs.detach_all();
  return ok;
}

bool test_local_put_skips_existing(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_local_skip");
  auto source = stage::test::write_file(ws.root() / "in" / "data.csv", "a,b\n");
  auto stage_dir = ws.dir("stage");
  stage::test::write_file(stage_dir / "data.csv.gz", "older");

  TransferCommand command = local_put(source, stage_dir);
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent first(put_query(source), command, session, fast_options(ws.dir("tmp")));
  first.execute();
  bool ok = first.result().rows.at(0).status == "SKIPPED";
  ok = ok && stage::test::read_file(stage_dir / "data.csv.gz") == "older";

  command.overwrite = true;
  FileTransferAgent second(put_query(source), command, session, fast_options(ws.dir("tmp")));
  second.execute();
  ok = ok && second.result().rows.at(0).status == "UPLOADED";
  ok = ok && stage::test::gunzip_file(stage_dir / "data.csv.gz") == "a,b\n";
  return ok;
}

bool test_local_put_stream(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_stream");
  auto stage_dir = ws.dir("stage");
  const std::string content = stage::test::make_payload(4096, 'c');

  TransferCommand command = local_put("ignored.csv", stage_dir);
  command.upload_stream = stage::test::make_stream(content);
  command.stream_dest_file_name = "from_memory.csv";
  command.dest_stage_path = "nested/dir";
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent("PUT file://ignored.csv @~", command, session, fast_options(ws.dir("tmp")));
  agent.execute();

  const auto& row = agent.result().rows.at(0);
  bool ok = row.status == "UPLOADED" && row.src_file_name == "from_memory.csv" && row.src_file_size == 4096;
  ok = ok && stage::test::gunzip_file(stage_dir / "nested" / "dir" / "from_memory.csv.gz") == content;

  command.src_locations = {"a.csv", "b.csv"};
  FileTransferAgent bad("PUT file://a.csv @~", command, session, fast_options(ws.dir("tmp")));
  ok = ok && throws_code([&]{ bad.execute(); }, TransferErrorCode::InvalidInput);
  return ok;
}

bool test_local_get_three_files(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_local_get");
  auto stage_dir = ws.dir("stage");
  stage::test::write_file(stage_dir / "a.csv.gz", "aaa");
  stage::test::write_file(stage_dir / "b.csv.gz", "bbbb");
  stage::test::write_file(stage_dir / "c.csv.gz", "ccccc");

  TransferCommand command;
  command.kind = CommandKind::Download;
  command.src_locations = {"a.csv.gz", "b.csv.gz", "c.csv.gz"};
  command.stage_info.location_type = kLocalFsLocationType;
  command.stage_info.location = stage_dir.string();
  command.local_location = (ws.root() / "out" / "fresh").string();
  command.threshold = 1;
  command.parallel = 2;
  command.encryption_materials = {EncryptionMaterial{"k", "q", 1}, EncryptionMaterial{"k", "q", 2},
                                  EncryptionMaterial{"k", "q", 3}};
  command.src_file_sizes = {3, 4, 5};

  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent("GET @~ file://out", command, session, fast_options(ws.dir("tmp")));
  agent.execute();

  const auto& table = agent.result();
  bool ok = table.rows.size() == 3;
  for(const auto& row : table.rows) {
    ok = ok && row.status == "DOWNLOADED" && row.source_compression.empty() && row.target_compression.empty();
  }
  ok = ok && stage::test::read_file(ws.root() / "out" / "fresh" / "c.csv.gz") == "ccccc";
  ok = ok && table.rows[0].src_file_name == "a.csv.gz" && table.rows[0].dest_file_size == 3;

  command.src_locations.push_back("missing.csv.gz");
  command.encryption_materials.push_back(std::nullopt);
  command.src_file_sizes.clear();
  command.overwrite = true;
  FileTransferAgent again("GET @~ file://out", command, session, fast_options(ws.dir("tmp")));
  again.execute();
  const auto& rows = again.result().rows;
  ok = ok && rows.size() == 4;
  for(const auto& row : rows) {
    bool missing = row.src_file_name == "missing.csv.gz";
    ok = ok && row.status == (missing ? "NOT_FOUND_FILE" : "DOWNLOADED") && row.message.empty() != missing;
  }

  command.encryption_materials.pop_back();
  FileTransferAgent mismatch("GET @~ file://out", command, session, fast_options(ws.dir("tmp")));
  ok = ok && throws_code([&]{ mismatch.execute(); }, TransferErrorCode::EncryptionMaterialMismatch);
  return ok;
}

bool test_renew_token_then_uploaded(TestContext& ctx) {
  stage::test::Workspace ws("stagexfer_transfer_renew");
  auto source = stage::test::write_file(ws.root() / "in" / "data.csv", stage::test::make_payload(100));

  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->script("data.csv", {ResultStatus::RenewToken});
  auto options = fast_options(ws.dir("tmp"));
  backend->register_with(options.backends, "S3");

  TransferCommand command = remote_put(source, "S3", "t1");
  TransferCommand renewed = command;
  renewed.stage_info.credentials["token"] = "t2";
  auto session = std::make_shared<stage::test::ScriptedSession>(renewed);

  FileTransferAgent agent(put_query(source), command, session, options);
  ctx.logs.attach(agent.logger());
  agent.execute();

  auto attempts = backend->attempts();
  bool ok = agent.result().rows.size() == 1 && agent.result().rows[0].status == "UPLOADED";
  ok = ok && attempts.size() == 2 && attempts[0].token == "t1" && attempts[1].token == "t2";
  ok = ok && session->calls() == 1 && agent.credential_renewals() == 1;
  ok = ok && ctx.logs.contains("Renewing stage credentials");
  ctx.logs.detach_all();
  return ok;
}

bool test_single_flight_renewal(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_single_flight");
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  for(int i = 0; i < 6; ++i) {
    std::string name = "part" + std::to_string(i) + ".csv";
    stage::test::write_file(ws.root() / "in" / name, stage::test::make_payload(50 + i));
    backend->script(name, {ResultStatus::RenewToken});
  }
  backend->set_latency(20ms);
  auto options = fast_options(ws.dir("tmp"));
  backend->register_with(options.backends, "S3");

  auto pattern = ws.root() / "in" / "*.csv";
  TransferCommand command = remote_put(pattern, "S3", "t1");
  command.parallel = 6;
  TransferCommand renewed = command;
  renewed.stage_info.credentials["token"] = "t2";
  auto session = std::make_shared<stage::test::ScriptedSession>(renewed, 30ms);

  FileTransferAgent agent(put_query(pattern), command, session, options);
  agent.execute();

  bool ok = agent.result().rows.size() == 6;
  for(const auto& row : agent.result().rows) ok = ok && row.status == "UPLOADED";
  ok = ok && session->calls() == 1 && backend->clients_built() == 2;
  std::size_t renewed_attempts = 0;
  for(const auto& attempt : backend->attempts()) {
    if(attempt.token == "t2") ++renewed_attempts;
  }
  ok = ok && renewed_attempts == 6;
  return ok;
}

bool test_retry_exhaustion_marks_error(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_retry_exhaustion");
  auto source = stage::test::write_file(ws.root() / "in" / "flaky.csv", "x");
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->script("flaky.csv", std::vector<ResultStatus>(10, ResultStatus::NeedRetry));
  auto options = fast_options(ws.dir("tmp"));
  options.executor.max_retries = 2;
  backend->register_with(options.backends, "S3");

  TransferCommand command = remote_put(source, "S3", "t1");
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(source), command, session, options);
  agent.execute();

  const auto& row = agent.result().rows.at(0);
  bool ok = row.status == "ERROR" && row.message.find("retry limit") != std::string::npos;
  ok = ok && backend->attempts().size() == 3 && agent.result().has_errors();
  ok = ok && dir_is_empty(ws.root() / "tmp");
  return ok;
}

bool test_lower_concurrency_retry(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_lower_concurrency");
  auto source = stage::test::write_file(ws.root() / "in" / "big.csv", stage::test::make_payload(4096));
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->script("big.csv", {ResultStatus::NeedRetryWithLowerConcurrency});
  auto options = fast_options(ws.dir("tmp"));
  backend->register_with(options.backends, "S3");

  TransferCommand command = remote_put(source, "S3", "t1");
  command.threshold = 1024;
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(source), command, session, options);
  agent.execute();

  auto attempts = backend->attempts();
  return agent.result().rows.at(0).status == "UPLOADED" &&
         attempts.size() == 2 && attempts[0].parallel == 4 && attempts[1].parallel == 1 &&
         agent.records()[0].retry_count == 1;
}

bool test_renewal_limit_marks_error(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_renewal_limit");
  auto source = stage::test::write_file(ws.root() / "in" / "data.csv", "x");
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->script("data.csv", std::vector<ResultStatus>(10, ResultStatus::RenewToken));
  auto options = fast_options(ws.dir("tmp"));
  options.executor.max_renewals = 2;
  backend->register_with(options.backends, "S3");

  TransferCommand command = remote_put(source, "S3", "t1");
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(source), command, session, options);
  agent.execute();

  const auto& row = agent.result().rows.at(0);
  return row.status == "ERROR" && row.message.find("renewal limit") != std::string::npos &&
         session->calls() == 2;
}

bool test_gcs_upload_presigned_urls(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_gcs_put");
  stage::test::write_file(ws.root() / "in" / "a.csv", "aaa");
  stage::test::write_file(ws.root() / "in" / "b.csv", "bbb");
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->script("b.csv", {ResultStatus::RenewPresignedUrl});
  auto options = fast_options(ws.dir("tmp"));
  backend->register_with(options.backends, kGcsLocationType);

  auto pattern = ws.root() / "in" / "*.csv";
  TransferCommand command = remote_put(pattern, kGcsLocationType, "t1");
  command.parallel = 1;
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(pattern), command, session, options);
  agent.execute();

  auto queries = session->queries();
  bool ok = queries.size() == 3;
  ok = ok && queries[0] == put_query(ws.root() / "in" / "a.csv");
  ok = ok && queries[1] == put_query(ws.root() / "in" / "b.csv");

  auto attempts = backend->attempts();
  ok = ok && attempts.size() == 3;
  for(const auto& attempt : attempts) {
    ok = ok && attempt.presigned_url.find(attempt.file) != std::string::npos;
  }
  ok = ok && attempts[1].presigned_url != attempts[2].presigned_url;
  for(const auto& row : agent.result().rows) ok = ok && row.status == "UPLOADED";
  return ok;
}

bool test_gcs_download_url_refresh(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_gcs_get");
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->script("b.csv.gz", {ResultStatus::RenewPresignedUrl});
  auto options = fast_options(ws.dir("tmp"));
  backend->register_with(options.backends, kGcsLocationType);

  TransferCommand command;
  command.kind = CommandKind::Download;
  command.src_locations = {"a.csv.gz", "b.csv.gz"};
  command.stage_info = stage::test::remote_stage(kGcsLocationType, "t1");
  command.local_location = (ws.root() / "out").string();
  command.encryption_materials = {std::nullopt, std::nullopt};
  command.presigned_urls = {"https://old/a", "https://old/b"};
  command.parallel = 1;
  TransferCommand refreshed = command;
  refreshed.presigned_urls = {"https://new/a", "https://new/b"};
  auto session = std::make_shared<stage::test::ScriptedSession>(refreshed);

  FileTransferAgent agent("GET @~ file://out", command, session, options);
  agent.execute();

  auto attempts = backend->attempts();
  bool ok = attempts.size() == 3 && attempts[0].presigned_url == "https://old/a";
  ok = ok && attempts[1].presigned_url == "https://old/b" && attempts[2].presigned_url == "https://new/b";
  ok = ok && session->calls() == 1 && agent.url_refreshes() == 1;
  for(const auto& row : agent.result().rows) ok = ok && row.status == "DOWNLOADED";

  command.presigned_urls.pop_back();
  FileTransferAgent short_list("GET @~ file://out", command, session, options);
  ok = ok && throws_code([&]{ short_list.execute(); }, TransferErrorCode::InvalidInput);
  return ok;
}

bool test_large_files_first_and_bounded_pool(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_ordering");
  stage::test::write_file(ws.root() / "in" / "a_large.csv", stage::test::make_payload(300));
  stage::test::write_file(ws.root() / "in" / "b_large.csv", stage::test::make_payload(400));
  for(int i = 0; i < 8; ++i) {
    stage::test::write_file(ws.root() / "in" / ("s" + std::to_string(i) + ".csv"), stage::test::make_payload(10));
  }
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->set_latency(15ms);
  auto options = fast_options(ws.dir("tmp"));
  backend->register_with(options.backends, "S3");

  auto pattern = ws.root() / "in" / "*.csv";
  TransferCommand command = remote_put(pattern, "S3", "t1");
  command.threshold = 200;
  command.parallel = 3;
  command.auto_compress = false;
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(pattern), command, session, options);
  agent.execute();

  const auto& rows = agent.result().rows;
  auto attempts = backend->attempts();
  bool ok = rows.size() == 10 && rows[0].src_file_name == "a_large.csv" && rows[1].src_file_name == "b_large.csv";
  ok = ok && attempts[0].file == "a_large.csv" && attempts[1].file == "b_large.csv";
  ok = ok && backend->max_in_flight() <= 3 && backend->max_in_flight() >= 1;
  ok = ok && rows[0].dest_file_name == "a_large.csv" && rows[0].dest_file_size == 300;
  return ok;
}

bool test_cancel_before_start(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_cancel_early");
  auto source = stage::test::write_file(ws.root() / "in" / "data.csv", "x");
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  auto options = fast_options(ws.dir("tmp"));
  backend->register_with(options.backends, "S3");

  CancellationFlag cancel;
  cancel.cancel();
  TransferCommand command = remote_put(source, "S3", "t1");
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(source), command, session, options, cancel);
  bool ok = throws_code([&]{ agent.execute(); }, TransferErrorCode::Cancelled);
  return ok && backend->attempts().empty();
}

bool test_cancel_during_retry(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_cancel_retry");
  auto source = stage::test::write_file(ws.root() / "in" / "data.csv", "x");
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->script("data.csv", std::vector<ResultStatus>(100, ResultStatus::NeedRetry));
  auto tmp = ws.dir("tmp");
  auto options = fast_options(tmp);
  options.executor.max_retries = 100;
  options.executor.retry_backoff = 200ms;
  options.executor.retry_backoff_max = 200ms;
  backend->register_with(options.backends, "S3");

  CancellationFlag cancel;
  TransferCommand command = remote_put(source, "S3", "t1");
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(source), command, session, options, cancel);

  std::thread canceller([&]{
    stage::test::wait_for_condition([&]{ return !backend->attempts().empty(); }, 2s);
    cancel.cancel();
  });
  bool ok = throws_code([&]{ agent.execute(); }, TransferErrorCode::Cancelled);
  canceller.join();
  return ok && backend->attempts().size() < 5 && dir_is_empty(tmp);
}

bool test_storage_exception_propagates(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_backend_throw");
  for(const char* name : {"a.csv", "b.csv", "c.csv"}) {
    stage::test::write_file(ws.root() / "in" / name, "x");
  }
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  backend->throw_on("b.csv");
  auto tmp = ws.dir("tmp");
  auto options = fast_options(tmp);
  backend->register_with(options.backends, "S3");

  auto pattern = ws.root() / "in" / "*.csv";
  TransferCommand command = remote_put(pattern, "S3", "t1");
  auto session = std::make_shared<stage::test::ScriptedSession>(command);
  FileTransferAgent agent(put_query(pattern), command, session, options);

  bool threw = false;
  try {
    agent.execute();
  } catch(const std::runtime_error& e) {
    threw = std::string(e.what()).find("b.csv") != std::string::npos;
  }
  return threw && dir_is_empty(tmp);
}

bool test_batch_fatal_configuration(TestContext&) {
  stage::test::Workspace ws("stagexfer_transfer_fatal");
  auto source = stage::test::write_file(ws.root() / "in" / "data.csv", "x");
  auto backend = std::make_shared<stage::test::ScriptedBackend>();
  auto options = fast_options(ws.dir("tmp"));
  backend->register_with(options.backends, "S3");

  TransferCommand azure = remote_put(source, "AZURE", "t1");
  auto session = std::make_shared<stage::test::ScriptedSession>(azure);
  FileTransferAgent unknown(put_query(source), azure, session, options);
  bool ok = throws_code([&]{ unknown.execute(); }, TransferErrorCode::StorageClient);

  TransferCommand lzma = remote_put(source, "S3", "t1");
  lzma.source_compression = "LZMA";
  FileTransferAgent unsupported(put_query(source), lzma, session, options);
  ok = ok && throws_code([&]{ unsupported.execute(); }, TransferErrorCode::UnsupportedCompression);

  TransferCommand nothing = remote_put(ws.root() / "in" / "*.parquet", "S3", "t1");
  FileTransferAgent empty(put_query(ws.root() / "in"), nothing, session, options);
  ok = ok && throws_code([&]{ empty.execute(); }, TransferErrorCode::NoFileFound);

  ok = ok && backend->attempts().empty();
  ok = ok && throws_code([&]{ (void)unknown.result(); }, TransferErrorCode::Internal);
  return ok;
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("STAGEXFER_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("STAGEXFER_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  stage::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"local_put_single_file", test_local_put_single_file},
    {"local_put_skips_existing", test_local_put_skips_existing},
    {"local_put_stream", test_local_put_stream},
    {"local_get_three_files", test_local_get_three_files},
    {"renew_token_then_uploaded", test_renew_token_then_uploaded},
    {"single_flight_renewal", test_single_flight_renewal},
    {"retry_exhaustion_marks_error", test_retry_exhaustion_marks_error},
    {"lower_concurrency_retry", test_lower_concurrency_retry},
    {"renewal_limit_marks_error", test_renewal_limit_marks_error},
    {"gcs_upload_presigned_urls", test_gcs_upload_presigned_urls},
    {"gcs_download_url_refresh", test_gcs_download_url_refresh},
    {"large_files_first_and_bounded_pool", test_large_files_first_and_bounded_pool},
    {"cancel_before_start", test_cancel_before_start},
    {"cancel_during_retry", test_cancel_during_retry},
    {"storage_exception_propagates", test_storage_exception_propagates},
    {"batch_fatal_configuration", test_batch_fatal_configuration}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " transfer tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " transfer tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
