#pragma once

#include <stdexcept>
#include <string>

enum class TransferErrorCode {
  InvalidInput,
  FileNotFound,
  NotAFile,
  NoFileFound,
  UnsupportedCompression,
  EncryptionMaterialMismatch,
  StorageClient,
  Renewal,
  Cancelled,
  Internal
};

inline const char* to_string(TransferErrorCode code) {
  switch(code) {
    case TransferErrorCode::InvalidInput: return "invalid_input";
    case TransferErrorCode::FileNotFound: return "file_not_found";
    case TransferErrorCode::NotAFile: return "not_a_file";
    case TransferErrorCode::NoFileFound: return "no_file_found";
    case TransferErrorCode::UnsupportedCompression: return "unsupported_compression";
    case TransferErrorCode::EncryptionMaterialMismatch: return "encryption_material_mismatch";
    case TransferErrorCode::StorageClient: return "storage_client";
    case TransferErrorCode::Renewal: return "renewal";
    case TransferErrorCode::Cancelled: return "cancelled";
    case TransferErrorCode::Internal: return "internal";
  }
  return "unknown";
}

// Batch-fatal failure. Per-file outcomes are carried as ResultStatus instead.
class TransferError : public std::runtime_error {
public:
  TransferError(TransferErrorCode code, const std::string& message)
    : std::runtime_error(std::string(to_string(code)) + ": " + message),
      code_(code) {}

  TransferErrorCode code() const { return code_; }
  const char* code_name() const { return to_string(code_); }

private:
  TransferErrorCode code_;
};
