#include "transfer_executor.hpp"

#include <asio.hpp>

#include <algorithm>
#include <exception>
#include <iterator>
#include <mutex>
#include <thread>

#include "payload_stage.hpp"
#include "storage_client.hpp"
#include "transfer_error.hpp"

TransferExecutor::TransferExecutor(StageRenewalCoordinator& coordinator,
                                   Options options,
                                   CancellationFlag cancel,
                                   std::shared_ptr<Logger> logger)
  : coordinator_(coordinator),
    options_(std::move(options)),
    cancel_(std::move(cancel)),
    logger_(std::move(logger)) {}

std::vector<FileTransferRecord> TransferExecutor::run(SizeBuckets buckets, int parallel) {
  std::vector<FileTransferRecord> results = run_sequential(std::move(buckets.large));
  std::vector<FileTransferRecord> small = run_parallel(std::move(buckets.small), parallel);
  results.insert(results.end(),
                 std::make_move_iterator(small.begin()),
                 std::make_move_iterator(small.end()));
  return results;
}

std::vector<FileTransferRecord> TransferExecutor::run_sequential(std::vector<FileTransferRecord> records) {
  std::vector<FileTransferRecord> results;
  results.reserve(records.size());
  for(auto& record : records) {
    results.push_back(run_file(std::move(record)));
  }
  return results;
}

std::vector<FileTransferRecord> TransferExecutor::run_parallel(std::vector<FileTransferRecord> records, int parallel) {
  std::vector<FileTransferRecord> results;
  if(records.empty()) return results;

  std::size_t width = std::min<std::size_t>(std::max(parallel, 1), records.size());
  log_debug(logger_.get(), "Transferring {} small file(s) with {} worker(s)", records.size(), width);

  std::mutex results_mutex;
  std::exception_ptr first_error;
  asio::thread_pool pool(width);
  for(auto& record : records) {
    asio::post(pool, [this, &results, &results_mutex, &first_error, record = std::move(record)]() mutable {
      try {
        FileTransferRecord done = run_file(std::move(record));
        std::lock_guard<std::mutex> lock(results_mutex);
        results.push_back(std::move(done));
      } catch(...) {
        std::lock_guard<std::mutex> lock(results_mutex);
        if(!first_error) first_error = std::current_exception();
      }
    });
  }
  pool.join();

  if(first_error) std::rethrow_exception(first_error);
  return results;
}

FileTransferRecord TransferExecutor::run_file(FileTransferRecord record) {
  cancel_.throw_if_cancelled("transferring " + record.src_file_name);
  if(!record.client) record = coordinator_.attach_client(std::move(record));

  std::unique_ptr<ScopedTempDir> tmp;
  try {
    tmp = std::make_unique<ScopedTempDir>(options_.temp_root);
  } catch(const std::filesystem::filesystem_error& e) {
    return fail(std::move(record), std::string("cannot create temporary directory: ") + e.what());
  }

  record.tmp_dir = tmp->path();
  if(record.kind == CommandKind::Upload) {
    record = prepare_upload_payload(std::move(record), tmp->path());
  }
  if(!record.result_status) {
    record = transfer_until_terminal(std::move(record));
  }
  tmp.reset();
  record.tmp_dir.clear();

  log_info(logger_.get(), "{} -> {}: {}", record.src_file_name, record.dest_file_name,
           to_string(*record.result_status));
  return record;
}

FileTransferRecord TransferExecutor::transfer_until_terminal(FileTransferRecord record) {
  while(true) {
    ResultStatus status = dispatch(record);
    if(is_terminal(status)) {
      record.result_status = status;
      return record;
    }
    log_debug(logger_.get(), "{} reported {}", record.src_file_name, to_string(status));

    switch(status) {
      case ResultStatus::RenewToken:
      case ResultStatus::RenewPresignedUrl:
        if(++record.renew_count > options_.max_renewals) {
          return fail(std::move(record), "renewal limit of " + std::to_string(options_.max_renewals) +
                                         " reached after " + to_string(status));
        }
        cancel_.throw_if_cancelled("renewing " + record.src_file_name);
        record = status == ResultStatus::RenewToken
          ? coordinator_.renew_credentials(std::move(record))
          : coordinator_.refresh_presigned_url(std::move(record));
        break;

      case ResultStatus::NeedRetryWithLowerConcurrency:
        record.parallel = 1;
        [[fallthrough]];
      case ResultStatus::NeedRetry:
        if(++record.retry_count > options_.max_retries) {
          return fail(std::move(record), "retry limit of " + std::to_string(options_.max_retries) +
                                         " reached after " + to_string(status));
        }
        wait_before_retry(record);
        break;

      default:
        throw TransferError(TransferErrorCode::Internal,
                            std::string("unhandled transfer status ") + to_string(status));
    }
  }
}

ResultStatus TransferExecutor::dispatch(FileTransferRecord& record) const {
  if(!record.client) {
    throw TransferError(TransferErrorCode::Internal, "no storage client for " + record.src_file_name);
  }
  record.last_error.clear();
  const StorageClient::Operation& op = record.kind == CommandKind::Upload
    ? record.client->upload
    : record.client->download;
  return op(record);
}

FileTransferRecord TransferExecutor::fail(FileTransferRecord record, const std::string& message) const {
  log_warn(logger_.get(), "{} failed: {}", record.src_file_name, message);
  record.result_status = ResultStatus::Error;
  record.last_error = message;
  return record;
}

void TransferExecutor::wait_before_retry(const FileTransferRecord& record) const {
  auto delay = backoff_delay(record.retry_count, options_.retry_backoff, options_.retry_backoff_max);
  log_debug(logger_.get(), "Retrying {} in {} ms (attempt {})", record.src_file_name, delay.count(),
            record.retry_count);
  auto deadline = std::chrono::steady_clock::now() + delay;
  while(std::chrono::steady_clock::now() < deadline) {
    cancel_.throw_if_cancelled("retrying " + record.src_file_name);
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(50)));
  }
  cancel_.throw_if_cancelled("retrying " + record.src_file_name);
}

std::chrono::milliseconds TransferExecutor::backoff_delay(int attempt,
                                                          std::chrono::milliseconds base,
                                                          std::chrono::milliseconds max) {
  if(attempt < 1 || base.count() <= 0) return std::chrono::milliseconds(0);
  auto delay = base;
  for(int i = 1; i < attempt && delay < max; ++i) delay *= 2;
  return std::min(delay, max);
}
