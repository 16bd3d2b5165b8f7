#include "metadata_builder.hpp"

#include <filesystem>

#include "log.hpp"
#include "transfer_error.hpp"

namespace fs = std::filesystem;

namespace {

int64_t local_file_size(const std::string& path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if(ec) {
    throw TransferError(TransferErrorCode::FileNotFound,
                        "cannot stat " + path + ": " + ec.message());
  }
  return static_cast<int64_t>(size);
}

FileTransferRecord base_record(const TransferCommand& command, std::size_t index) {
  FileTransferRecord record;
  record.kind = command.kind;
  record.index = index;
  record.stage_info = command.stage_info;
  record.presigned_url = command.stage_info.presigned_url;
  record.overwrite = command.overwrite;
  return record;
}

} // namespace

void validate_stream_upload(const TransferCommand& command) {
  if(command.is_stream_upload() && command.src_locations.size() != 1) {
    throw TransferError(TransferErrorCode::InvalidInput,
                        "invalid stream put: expected exactly one source location, got " +
                        std::to_string(command.src_locations.size()));
  }
}

std::vector<FileTransferRecord> build_upload_records(const TransferCommand& command,
                                                     const std::vector<std::string>& files) {
  validate_stream_upload(command);
  const bool stream = command.is_stream_upload();

  std::vector<FileTransferRecord> records;
  records.reserve(files.size());
  for(std::size_t i = 0; i < files.size(); ++i) {
    const std::string& file = files[i];
    FileTransferRecord record = base_record(command, i);
    record.src_file_path = file;
    record.src_file_name = (stream && !command.stream_dest_file_name.empty())
      ? command.stream_dest_file_name
      : fs::path(file).filename().string();

    record.source_compression = compression::resolve_source_compression(
      command.source_compression,
      stream ? fs::path(record.src_file_name) : fs::path(file),
      stream ? command.upload_stream.get() : nullptr);

    record.src_file_size = stream
      ? static_cast<int64_t>(command.upload_stream->size())
      : local_file_size(file);
    record.upload_stream = stream ? command.upload_stream : nullptr;
    record.dest_stage_path = command.dest_stage_path;
    record.require_compress = command.auto_compress && record.source_compression.is_none();
    if(record.require_compress) {
      record.target_compression = compression::gzip();
      record.dest_file_name = record.src_file_name + compression::gzip().file_extension;
    } else {
      record.target_compression = record.source_compression;
      record.dest_file_name = record.src_file_name;
    }
    if(!command.encryption_materials.empty()) {
      record.encryption_material = command.encryption_materials.front();
    }
    record.parallel = (!stream && record.src_file_size > command.threshold) ? command.parallel : 1;

    log_debug(nullptr, "Upload {} -> {} ({} bytes, source compression {}, compress {})",
              record.src_file_path, record.dest_file_name, record.src_file_size,
              record.source_compression.name, record.require_compress);
    records.push_back(std::move(record));
  }
  return records;
}

std::vector<FileTransferRecord> build_download_records(const TransferCommand& command) {
  const std::size_t count = command.src_locations.size();
  if(command.encryption_materials.size() != count) {
    throw TransferError(TransferErrorCode::EncryptionMaterialMismatch,
                        "expected " + std::to_string(count) + " encryption materials, got " +
                        std::to_string(command.encryption_materials.size()));
  }
  const bool sizes_known = command.src_file_sizes.size() == count;

  std::vector<FileTransferRecord> records;
  records.reserve(count);
  for(std::size_t i = 0; i < count; ++i) {
    FileTransferRecord record = base_record(command, i);
    record.src_file_name = command.src_locations[i];
    record.dest_file_name = command.src_locations[i];
    record.local_location = command.local_location;
    record.encryption_material = command.encryption_materials[i];
    record.src_file_size = sizes_known ? command.src_file_sizes[i] : 0;
    record.parallel = record.src_file_size > command.threshold ? command.parallel : 1;
    records.push_back(std::move(record));
  }
  return records;
}
