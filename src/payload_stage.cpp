#include "payload_stage.hpp"

#include <zlib.h>

#include <fstream>
#include <stdexcept>
#include <vector>

#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kZlibChunk = 64 * 1024;
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kDeflateMemLevel = 8;
constexpr std::size_t kTempNameLength = 12;

class GzipWriter {
public:
  explicit GzipWriter(const fs::path& target)
    : out_(target, std::ios::binary | std::ios::trunc), target_(target) {
    if(!out_) throw std::runtime_error("file_open_failed: cannot create " + target.string());
    if(deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits,
                    kDeflateMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
      throw std::runtime_error("gzip: deflateInit2 failed");
    }
    initialised_ = true;
  }

  ~GzipWriter() {
    if(initialised_) deflateEnd(&stream_);
  }

  GzipWriter(const GzipWriter&) = delete;
  GzipWriter& operator=(const GzipWriter&) = delete;

  void write(const char* data, std::size_t size) {
    stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    stream_.avail_in = static_cast<uInt>(size);
    pump(Z_NO_FLUSH);
  }

  void finish() {
    stream_.next_in = nullptr;
    stream_.avail_in = 0;
    pump(Z_FINISH);
    out_.flush();
    if(!out_) throw std::runtime_error("file_write_failed: " + target_.string());
  }

private:
  void pump(int flush) {
    std::vector<unsigned char> buffer(kZlibChunk);
    do {
      stream_.next_out = buffer.data();
      stream_.avail_out = static_cast<uInt>(buffer.size());
      if(deflate(&stream_, flush) == Z_STREAM_ERROR) {
        throw std::runtime_error("gzip: deflate failed for " + target_.string());
      }
      std::size_t produced = buffer.size() - stream_.avail_out;
      out_.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(produced));
      if(!out_) throw std::runtime_error("file_write_failed: " + target_.string());
    } while(stream_.avail_out == 0);
  }

  z_stream stream_{};
  bool initialised_ = false;
  std::ofstream out_;
  fs::path target_;
};

bool payload_is_stream(const FileTransferRecord& record) {
  return record.upload_stream && record.real_src_file_path == record.src_file_path;
}

} // namespace

ScopedTempDir::ScopedTempDir(const fs::path& root) {
  fs::path base = root.empty() ? fs::temp_directory_path() : root;
  for(int attempt = 0; attempt < 8; ++attempt) {
    fs::path candidate = base / ("stagexfer-" + random_token(kTempNameLength));
    if(fs::create_directories(candidate)) {
      path_ = std::move(candidate);
      return;
    }
  }
  throw fs::filesystem_error("unable to create a unique temporary directory", base,
                             std::make_error_code(std::errc::file_exists));
}

ScopedTempDir::~ScopedTempDir() {
  if(path_.empty()) return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if(ec) log_warn(nullptr, "Failed to remove temporary directory {}: {}", path_.string(), ec.message());
}

FileTransferRecord compress_with_gzip(FileTransferRecord record, const fs::path& dir) {
  const fs::path target = dir / (record.src_file_name + "_c.gz");
  GzipWriter writer(target);
  if(record.upload_stream) {
    writer.write(record.upload_stream->data(), record.upload_stream->size());
  } else {
    std::ifstream in(record.src_file_path, std::ios::binary);
    if(!in) throw std::runtime_error("file_open_failed: cannot read " + record.src_file_path);
    std::vector<char> buffer(kZlibChunk);
    while(in) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      std::streamsize got = in.gcount();
      if(got <= 0) break;
      writer.write(buffer.data(), static_cast<std::size_t>(got));
    }
    if(in.bad()) throw std::runtime_error("file_read_failed: " + record.src_file_path);
  }
  writer.finish();

  record.real_src_file_path = target.string();
  record.dest_file_size = static_cast<int64_t>(fs::file_size(target));
  log_debug(nullptr, "Compressed {} to {} ({} bytes)", record.src_file_name, target.string(), record.dest_file_size);
  return record;
}

FileTransferRecord compute_digest_and_size(FileTransferRecord record) {
  if(payload_is_stream(record)) {
    record.sha256_digest = base64_from_bytes(sha256_bytes(*record.upload_stream));
    record.upload_size = static_cast<int64_t>(record.upload_stream->size());
  } else {
    record.sha256_digest = base64_from_bytes(sha256_file(record.real_src_file_path));
    record.upload_size = static_cast<int64_t>(fs::file_size(record.real_src_file_path));
  }
  return record;
}

FileTransferRecord prepare_upload_payload(FileTransferRecord record, const fs::path& dir) {
  record.real_src_file_path = record.src_file_path;
  try {
    FileTransferRecord prepared = record;
    if(prepared.require_compress) prepared = compress_with_gzip(std::move(prepared), dir);
    return compute_digest_and_size(std::move(prepared));
  } catch(const std::exception& e) {
    log_warn(nullptr, "Preparing {} failed: {}", record.src_file_name, e.what());
    record.result_status = ResultStatus::Error;
    record.last_error = e.what();
  }
  return record;
}
