#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

#include "log.hpp"
#include "size_classifier.hpp"
#include "stage_renewal.hpp"
#include "transfer_types.hpp"

// Drives each record through prepare -> transfer -> retry/renew until it reaches a
// terminal status. Large files go one at a time; small files share a bounded pool.
class TransferExecutor {
public:
  struct Options {
    std::filesystem::path temp_root;
    int max_retries = 5;
    std::chrono::milliseconds retry_backoff{100};
    std::chrono::milliseconds retry_backoff_max{5000};
    int max_renewals = 5;
  };

  TransferExecutor(StageRenewalCoordinator& coordinator,
                   Options options,
                   CancellationFlag cancel = CancellationFlag(),
                   std::shared_ptr<Logger> logger = nullptr);

  // Large bucket in submission order, then the small bucket in completion order.
  std::vector<FileTransferRecord> run(SizeBuckets buckets, int parallel);

  std::vector<FileTransferRecord> run_sequential(std::vector<FileTransferRecord> records);
  std::vector<FileTransferRecord> run_parallel(std::vector<FileTransferRecord> records, int parallel);

  // One file, start to finish. Storage client exceptions escape after the temp dir is gone.
  FileTransferRecord run_file(FileTransferRecord record);

  static std::chrono::milliseconds backoff_delay(int attempt,
                                                 std::chrono::milliseconds base,
                                                 std::chrono::milliseconds max);

private:
  FileTransferRecord transfer_until_terminal(FileTransferRecord record);
  ResultStatus dispatch(FileTransferRecord& record) const;
  FileTransferRecord fail(FileTransferRecord record, const std::string& message) const;
  void wait_before_retry(const FileTransferRecord& record) const;

  StageRenewalCoordinator& coordinator_;
  Options options_;
  CancellationFlag cancel_;
  std::shared_ptr<Logger> logger_;
};
