#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "result_table.hpp"
#include "storage_client.hpp"
#include "transfer_executor.hpp"
#include "transfer_session.hpp"
#include "transfer_types.hpp"

// Runs one PUT or GET batch: expand sources, build per-file records, classify by size,
// fetch presigned URLs, transfer and aggregate the result table.
class FileTransferAgent {
public:
  struct Options {
    std::string home_dir;
    int parallel_override = 0;
    TransferExecutor::Options executor;
    StorageBackendRegistry backends;
  };

  FileTransferAgent(std::string query,
                    TransferCommand command,
                    std::shared_ptr<TransferSession> session,
                    Options options,
                    CancellationFlag cancel = CancellationFlag());

  // Throws TransferError on batch-fatal conditions; per-file failures land in the table.
  void execute();

  const ResultTable& result() const;
  const std::vector<FileTransferRecord>& records() const { return records_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  // Renewal RPC counters of the last execute().
  std::size_t credential_renewals() const;
  std::size_t url_refreshes() const;

private:
  std::vector<FileTransferRecord> build_records();
  int effective_parallel() const;

  std::string query_;
  TransferCommand command_;
  std::shared_ptr<TransferSession> session_;
  Options options_;
  CancellationFlag cancel_;
  std::shared_ptr<Logger> logger_;

  std::unique_ptr<StageRenewalCoordinator> coordinator_;
  std::vector<FileTransferRecord> records_;
  std::optional<ResultTable> table_;
};
