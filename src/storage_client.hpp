#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "transfer_types.hpp"

enum class StorageClientType { Local, Remote };

// Strategy value selected once per stage descriptor. Implementations own their own
// retry/backoff and report RENEW_* / NEED_RETRY* signals through the returned status.
struct StorageClient {
  using Operation = std::function<ResultStatus(FileTransferRecord&)>;

  StorageClientType type = StorageClientType::Local;
  std::string location_type;
  Operation upload;
  Operation download;
};

using StorageBackendFactory = std::function<StorageClient(const StageInfo&)>;

// Provider backends (S3, AZURE, GCS, ...) are supplied by the embedding connector.
class StorageBackendRegistry {
public:
  void register_backend(const std::string& location_type, StorageBackendFactory factory);
  bool has_backend(const std::string& location_type) const;
  StorageClient create(const StageInfo& stage) const;

private:
  std::map<std::string, StorageBackendFactory> factories_;
};

StorageClientType storage_client_type(const StageInfo& stage);

StorageClient make_local_storage_client();

std::shared_ptr<const StorageClient> make_storage_client(const StageInfo& stage,
                                                         const StorageBackendRegistry& registry);
