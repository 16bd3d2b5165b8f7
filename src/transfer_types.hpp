#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "compression_types.hpp"

struct StorageClient;

enum class CommandKind { Upload, Download };

enum class ResultStatus {
  Error,
  Uploaded,
  Downloaded,
  Collision,
  Skipped,
  NotFoundFile,
  RenewToken,
  RenewPresignedUrl,
  NeedRetry,
  NeedRetryWithLowerConcurrency
};

const char* to_string(CommandKind kind);
const char* to_string(ResultStatus status);
std::optional<ResultStatus> parse_result_status(const std::string& text);

// Transient statuses are retry/renewal signals and must never reach the result table.
bool is_terminal(ResultStatus status);

inline const std::string kLocalFsLocationType = "LOCAL_FS";
inline const std::string kGcsLocationType = "GCS";

struct StageInfo {
  std::string location_type;
  std::string location;
  std::string path;
  std::string region;
  std::string end_point;
  std::string storage_account;
  std::map<std::string, std::string> credentials;
  std::string presigned_url;

  bool is_local() const { return location_type == kLocalFsLocationType; }
  bool requires_presigned_urls() const { return location_type == kGcsLocationType; }
};

struct EncryptionMaterial {
  std::string query_stage_master_key;
  std::string query_id;
  int64_t smk_id = 0;
};

struct TransferCommand {
  CommandKind kind = CommandKind::Upload;
  std::vector<std::string> src_locations;
  StageInfo stage_info;
  int64_t threshold = 0;
  int parallel = 1;
  bool auto_compress = true;
  std::string source_compression = compression::kAutoDetect;
  bool overwrite = false;
  // Download lists may hold nulls for unencrypted stages; they still count positionally.
  std::vector<std::optional<EncryptionMaterial>> encryption_materials;
  std::string local_location;
  std::vector<std::string> presigned_urls;
  std::vector<int64_t> src_file_sizes;

  // Stream upload: one source location, payload held in memory.
  std::shared_ptr<const std::vector<char>> upload_stream;
  std::string stream_dest_file_name;
  std::string dest_stage_path;

  bool is_stream_upload() const { return kind == CommandKind::Upload && upload_stream != nullptr; }
};

struct FileTransferRecord {
  CommandKind kind = CommandKind::Upload;
  std::size_t index = 0;

  std::string src_file_path;
  std::string src_file_name;
  std::string real_src_file_path;
  std::string dest_file_name;
  std::string local_location;
  std::string dest_stage_path;
  int64_t src_file_size = 0;
  int64_t dest_file_size = 0;
  int64_t upload_size = 0;
  bool overwrite = false;

  StageInfo stage_info;
  std::shared_ptr<const StorageClient> client;
  uint64_t client_epoch = 0;
  uint64_t url_epoch = 0;
  std::optional<EncryptionMaterial> encryption_material;
  std::string presigned_url;
  int parallel = 1;

  bool require_compress = false;
  CompressionType source_compression = compression::none();
  CompressionType target_compression = compression::none();

  std::filesystem::path tmp_dir;
  std::string sha256_digest;
  std::shared_ptr<const std::vector<char>> upload_stream;

  // Unset until the executor finalises the record.
  std::optional<ResultStatus> result_status;
  std::string last_error;
  int retry_count = 0;
  int renew_count = 0;
};

// Copies share the same flag, so a caller can keep one and hand another to the agent.
class CancellationFlag {
public:
  CancellationFlag() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { cancelled_->store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_->load(std::memory_order_acquire); }
  void throw_if_cancelled(const std::string& context) const;

private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};
