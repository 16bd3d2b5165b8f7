#include "stage_renewal.hpp"

#include "transfer_error.hpp"

StageRenewalCoordinator::StageRenewalCoordinator(std::string query,
                                                 const TransferCommand& command,
                                                 std::shared_ptr<TransferSession> session,
                                                 const StorageBackendRegistry& registry,
                                                 std::shared_ptr<Logger> logger)
  : query_(std::move(query)),
    kind_(command.kind),
    session_(std::move(session)),
    registry_(registry),
    logger_(std::move(logger)),
    stage_info_(command.stage_info),
    presigned_urls_(command.presigned_urls) {
  client_ = make_storage_client(stage_info_, registry_);
}

FileTransferRecord StageRenewalCoordinator::attach_client(FileTransferRecord record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  record.client = client_;
  record.client_epoch = credential_epoch_;
  return record;
}

std::vector<FileTransferRecord> StageRenewalCoordinator::update_presigned_urls(std::vector<FileTransferRecord> records) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!stage_info_.requires_presigned_urls()) return records;

  log_debug(logger_.get(), "Updating presigned URLs for {} file(s)", records.size());
  for(auto& record : records) {
    if(kind_ == CommandKind::Upload) {
      record = refresh_upload_url_locked(std::move(record));
    } else {
      assign_download_url_locked(record);
    }
  }
  return records;
}

FileTransferRecord StageRenewalCoordinator::refresh_presigned_url(FileTransferRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!stage_info_.requires_presigned_urls()) {
    log_warn(logger_.get(), "Presigned URL renewal requested for {} stage, ignoring", stage_info_.location_type);
    return record;
  }

  if(kind_ == CommandKind::Upload) return refresh_upload_url_locked(std::move(record));

  if(record.url_epoch == url_epoch_) {
    TransferCommand fresh = fetch_metadata(query_, std::nullopt);
    presigned_urls_ = fresh.presigned_urls;
    ++url_epoch_;
    ++url_refreshes_;
    log_info(logger_.get(), "Refreshed {} download URL(s)", presigned_urls_.size());
  }
  assign_download_url_locked(record);
  return record;
}

FileTransferRecord StageRenewalCoordinator::renew_credentials(FileTransferRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(record.client_epoch == credential_epoch_) {
    log_info(logger_.get(), "Renewing stage credentials after {}", record.src_file_name);
    TransferCommand fresh = fetch_metadata(query_, std::nullopt);
    auto client = make_storage_client(fresh.stage_info, registry_);
    stage_info_ = std::move(fresh.stage_info);
    client_ = std::move(client);
    if(!fresh.presigned_urls.empty()) presigned_urls_ = std::move(fresh.presigned_urls);
    ++credential_epoch_;
    ++credential_renewals_;
  } else {
    log_debug(logger_.get(), "Credentials already renewed, {} adopts epoch {}", record.src_file_name, credential_epoch_);
  }

  std::string url = record.presigned_url;
  record.client = client_;
  record.client_epoch = credential_epoch_;
  record.stage_info = stage_info_;
  record.presigned_url = url;
  return record;
}

std::size_t StageRenewalCoordinator::credential_renewals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return credential_renewals_;
}

std::size_t StageRenewalCoordinator::url_refreshes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return url_refreshes_;
}

std::string StageRenewalCoordinator::file_path_from_put_command(const std::string& query) {
  static const std::string kScheme = "file://";
  auto start = query.find(kScheme);
  if(start == std::string::npos) {
    throw TransferError(TransferErrorCode::InvalidInput, "no file:// location in '" + query + "'");
  }
  start += kScheme.size();
  auto end = query.find(' ', start);
  return end == std::string::npos ? query.substr(start) : query.substr(start, end - start);
}

std::string StageRenewalCoordinator::scope_query_to_file(const std::string& query, const std::string& file) {
  std::string batch_path = file_path_from_put_command(query);
  std::string scoped = query;
  scoped.replace(scoped.find("file://") + 7, batch_path.size(), file);
  return scoped;
}

TransferCommand StageRenewalCoordinator::fetch_metadata(const std::string& query,
                                                        const std::optional<std::string>& single_file) {
  try {
    return session_->execute_for_transfer_metadata(query, single_file);
  } catch(const TransferError&) {
    throw;
  } catch(const std::exception& e) {
    throw TransferError(TransferErrorCode::Renewal, std::string("metadata refresh failed: ") + e.what());
  }
}

FileTransferRecord StageRenewalCoordinator::refresh_upload_url_locked(FileTransferRecord record) {
  std::string scoped = scope_query_to_file(query_, record.src_file_path);
  TransferCommand fresh = fetch_metadata(scoped, record.src_file_path);
  record.stage_info = fresh.stage_info;
  record.presigned_url = fresh.stage_info.presigned_url;
  ++url_refreshes_;
  log_debug(logger_.get(), "Presigned URL for {} refreshed", record.src_file_name);
  return record;
}

void StageRenewalCoordinator::assign_download_url_locked(FileTransferRecord& record) const {
  if(record.index >= presigned_urls_.size()) {
    throw TransferError(TransferErrorCode::InvalidInput,
                        "no presigned URL for " + record.src_file_name + " at position " +
                        std::to_string(record.index));
  }
  record.presigned_url = presigned_urls_[record.index];
  record.url_epoch = url_epoch_;
}
