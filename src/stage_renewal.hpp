#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "storage_client.hpp"
#include "transfer_session.hpp"
#include "transfer_types.hpp"

// Owns the command-level state that renewal replaces: the stage descriptor, the storage
// client built from it and the presigned-URL list. Every refresh runs under one mutex and
// bumps an epoch; a worker only issues the RPC if the state it used is still current,
// otherwise it adopts what a sibling already fetched.
class StageRenewalCoordinator {
public:
  StageRenewalCoordinator(std::string query,
                          const TransferCommand& command,
                          std::shared_ptr<TransferSession> session,
                          const StorageBackendRegistry& registry,
                          std::shared_ptr<Logger> logger = nullptr);

  // Assigns the current storage client; the record keeps its own stage descriptor.
  FileTransferRecord attach_client(FileTransferRecord record) const;

  // Presigned URLs for the whole batch; a no-op unless the stage needs them.
  std::vector<FileTransferRecord> update_presigned_urls(std::vector<FileTransferRecord> records);

  // RENEW_PRESIGNED_URL for one file.
  FileTransferRecord refresh_presigned_url(FileTransferRecord record);

  // RENEW_TOKEN: re-issues the original statement once per epoch and hands back a fresh client.
  FileTransferRecord renew_credentials(FileTransferRecord record);

  std::size_t credential_renewals() const;
  std::size_t url_refreshes() const;

  // "PUT file:///tmp/data/*.csv @~" -> "/tmp/data/*.csv"
  static std::string file_path_from_put_command(const std::string& query);
  static std::string scope_query_to_file(const std::string& query, const std::string& file);

private:
  TransferCommand fetch_metadata(const std::string& query, const std::optional<std::string>& single_file);
  FileTransferRecord refresh_upload_url_locked(FileTransferRecord record);
  void assign_download_url_locked(FileTransferRecord& record) const;

  const std::string query_;
  const CommandKind kind_;
  std::shared_ptr<TransferSession> session_;
  const StorageBackendRegistry& registry_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  StageInfo stage_info_;
  std::shared_ptr<const StorageClient> client_;
  std::vector<std::string> presigned_urls_;
  uint64_t credential_epoch_ = 0;
  uint64_t url_epoch_ = 0;
  std::size_t credential_renewals_ = 0;
  std::size_t url_refreshes_ = 0;
};
