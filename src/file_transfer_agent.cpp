#include "file_transfer_agent.hpp"

#include <filesystem>

#include "metadata_builder.hpp"
#include "path_expander.hpp"
#include "size_classifier.hpp"
#include "transfer_error.hpp"

namespace fs = std::filesystem;

FileTransferAgent::FileTransferAgent(std::string query,
                                     TransferCommand command,
                                     std::shared_ptr<TransferSession> session,
                                     Options options,
                                     CancellationFlag cancel)
  : query_(std::move(query)),
    command_(std::move(command)),
    session_(std::move(session)),
    options_(std::move(options)),
    cancel_(std::move(cancel)),
    logger_(std::make_shared<Logger>("file-transfer")) {
  if(!session_) {
    throw TransferError(TransferErrorCode::InvalidInput, "file transfer agent needs a session");
  }
}

void FileTransferAgent::execute() {
  records_.clear();
  table_.reset();
  cancel_.throw_if_cancelled("starting " + std::string(to_string(command_.kind)));

  logger_->info("{} of {} location(s) to {} stage", to_string(command_.kind),
                command_.src_locations.size(),
                command_.stage_info.location_type.empty() ? "unknown" : command_.stage_info.location_type);

  std::vector<FileTransferRecord> records = build_records();
  SizeBuckets buckets = classify_by_size(std::move(records), command_.threshold);

  coordinator_ = std::make_unique<StageRenewalCoordinator>(query_, command_, session_, options_.backends, logger_);
  buckets.large = coordinator_->update_presigned_urls(std::move(buckets.large));
  buckets.small = coordinator_->update_presigned_urls(std::move(buckets.small));
  for(auto* bucket : {&buckets.large, &buckets.small}) {
    for(auto& record : *bucket) record = coordinator_->attach_client(std::move(record));
  }

  TransferExecutor executor(*coordinator_, options_.executor, cancel_, logger_);
  records_ = executor.run(std::move(buckets), effective_parallel());
  table_ = build_result_table(records_);

  logger_->info("{} finished: {} file(s){}", to_string(command_.kind), table_->rows.size(),
                table_->has_errors() ? ", with errors" : "");
}

const ResultTable& FileTransferAgent::result() const {
  if(!table_) {
    throw TransferError(TransferErrorCode::Internal, "result requested before execute() completed");
  }
  return *table_;
}

std::size_t FileTransferAgent::credential_renewals() const {
  return coordinator_ ? coordinator_->credential_renewals() : 0;
}

std::size_t FileTransferAgent::url_refreshes() const {
  return coordinator_ ? coordinator_->url_refreshes() : 0;
}

std::vector<FileTransferRecord> FileTransferAgent::build_records() {
  if(command_.kind == CommandKind::Upload) {
    validate_stream_upload(command_);
    std::vector<std::string> files;
    if(command_.is_stream_upload()) {
      files = command_.src_locations;
    } else {
      files = expand_all(command_.src_locations, resolve_home_directory(options_.home_dir));
    }
    logger_->debug("Expanded to {} file(s)", files.size());
    return build_upload_records(command_, files);
  }

  TransferCommand command = command_;
  if(!command.local_location.empty()) {
    command.local_location = expand_home(command.local_location, resolve_home_directory(options_.home_dir));
    std::error_code ec;
    fs::create_directories(command.local_location, ec);
    if(ec) {
      throw TransferError(TransferErrorCode::InvalidInput,
                          "cannot create local directory " + command.local_location + ": " + ec.message());
    }
  }
  return build_download_records(command);
}

int FileTransferAgent::effective_parallel() const {
  if(options_.parallel_override > 0) return options_.parallel_override;
  return command_.parallel > 0 ? command_.parallel : 1;
}
