#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "transfer_types.hpp"

// Control-plane collaborator: re-executes a PUT/GET statement and returns the fresh
// transfer metadata (stage descriptor, credentials, presigned URLs). Used for presigned
// URL refresh and for credential renewal.
class TransferSession {
public:
  virtual ~TransferSession() = default;

  virtual TransferCommand execute_for_transfer_metadata(const std::string& query,
                                                        const std::optional<std::string>& single_file) = 0;
};

// Replays a response document from disk on every call. Lets the CLI drive LOCAL_FS
// stages without a live server.
class CommandFileSession : public TransferSession {
public:
  explicit CommandFileSession(std::filesystem::path command_file);

  TransferCommand execute_for_transfer_metadata(const std::string& query,
                                                const std::optional<std::string>& single_file) override;

  std::size_t calls() const;

private:
  std::filesystem::path command_file_;
  mutable std::mutex mutex_;
  std::size_t calls_ = 0;
};
