#include "storage_client.hpp"

#include <filesystem>
#include <fstream>

#include "log.hpp"
#include "transfer_error.hpp"

namespace fs = std::filesystem;

namespace {

ResultStatus local_upload(FileTransferRecord& record) {
  fs::path target_dir = fs::path(record.stage_info.location);
  if(!record.dest_stage_path.empty()) target_dir /= record.dest_stage_path;
  const fs::path target = target_dir / record.dest_file_name;
  try {
    fs::create_directories(target_dir);
    if(fs::exists(target) && !record.overwrite) {
      log_debug(nullptr, "Local stage already has {}, skipping", target.string());
      record.dest_file_size = record.upload_size;
      return ResultStatus::Skipped;
    }
    if(record.upload_stream && record.real_src_file_path == record.src_file_path) {
      std::ofstream out(target, std::ios::binary | std::ios::trunc);
      if(!out) {
        record.last_error = "file_open_failed: cannot write " + target.string();
        return ResultStatus::Error;
      }
      out.write(record.upload_stream->data(), static_cast<std::streamsize>(record.upload_stream->size()));
      if(!out) {
        record.last_error = "file_write_failed: " + target.string();
        return ResultStatus::Error;
      }
    } else {
      fs::copy_file(record.real_src_file_path, target, fs::copy_options::overwrite_existing);
    }
  } catch(const fs::filesystem_error& e) {
    record.last_error = e.what();
    return ResultStatus::Error;
  }
  record.dest_file_size = record.upload_size;
  return ResultStatus::Uploaded;
}

ResultStatus local_download(FileTransferRecord& record) {
  const fs::path source = fs::path(record.stage_info.location) / record.src_file_name;
  const fs::path target = fs::path(record.local_location) / record.dest_file_name;
  try {
    if(!fs::is_regular_file(source)) {
      record.last_error = "file not found: " + source.string();
      return ResultStatus::NotFoundFile;
    }
    record.src_file_size = static_cast<int64_t>(fs::file_size(source));
    if(fs::exists(target) && !record.overwrite) {
      record.dest_file_size = static_cast<int64_t>(fs::file_size(target));
      return ResultStatus::Skipped;
    }
    if(target.has_parent_path()) fs::create_directories(target.parent_path());
    fs::copy_file(source, target, fs::copy_options::overwrite_existing);
    record.dest_file_size = static_cast<int64_t>(fs::file_size(target));
  } catch(const fs::filesystem_error& e) {
    record.last_error = e.what();
    return ResultStatus::Error;
  }
  return ResultStatus::Downloaded;
}

} // namespace

void StorageBackendRegistry::register_backend(const std::string& location_type,
                                              StorageBackendFactory factory) {
  factories_[location_type] = std::move(factory);
}

bool StorageBackendRegistry::has_backend(const std::string& location_type) const {
  return factories_.count(location_type) > 0;
}

StorageClient StorageBackendRegistry::create(const StageInfo& stage) const {
  auto it = factories_.find(stage.location_type);
  if(it == factories_.end()) {
    throw TransferError(TransferErrorCode::StorageClient,
                        "no storage backend registered for stage type '" + stage.location_type + "'");
  }
  StorageClient client = it->second(stage);
  client.type = StorageClientType::Remote;
  client.location_type = stage.location_type;
  if(!client.upload || !client.download) {
    throw TransferError(TransferErrorCode::StorageClient,
                        "storage backend for '" + stage.location_type + "' is incomplete");
  }
  return client;
}

StorageClientType storage_client_type(const StageInfo& stage) {
  return stage.is_local() ? StorageClientType::Local : StorageClientType::Remote;
}

StorageClient make_local_storage_client() {
  StorageClient client;
  client.type = StorageClientType::Local;
  client.location_type = kLocalFsLocationType;
  client.upload = local_upload;
  client.download = local_download;
  return client;
}

std::shared_ptr<const StorageClient> make_storage_client(const StageInfo& stage,
                                                         const StorageBackendRegistry& registry) {
  if(storage_client_type(stage) == StorageClientType::Local) {
    return std::make_shared<const StorageClient>(make_local_storage_client());
  }
  return std::make_shared<const StorageClient>(registry.create(stage));
}
