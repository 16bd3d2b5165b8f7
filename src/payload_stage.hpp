#pragma once

#include <filesystem>

#include "transfer_types.hpp"

// Per-file working directory under the temp root with a random name. Removal is
// best-effort and happens on every exit path, including unwinding.
class ScopedTempDir {
public:
  explicit ScopedTempDir(const std::filesystem::path& root = std::filesystem::path());
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Gzips the source file (or the in-memory stream) into dir/<name>_c.gz and points the
// record's real source at it. Throws on I/O or zlib failure.
FileTransferRecord compress_with_gzip(FileTransferRecord record, const std::filesystem::path& dir);

// SHA-256 (base64) and byte count of exactly what will be sent.
FileTransferRecord compute_digest_and_size(FileTransferRecord record);

// Compress-if-required then digest. Failures end only this record, as ERROR.
FileTransferRecord prepare_upload_payload(FileTransferRecord record, const std::filesystem::path& dir);
