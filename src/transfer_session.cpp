#include "transfer_session.hpp"

#include "log.hpp"
#include "transfer_command.hpp"

CommandFileSession::CommandFileSession(std::filesystem::path command_file)
  : command_file_(std::move(command_file)) {}

TransferCommand CommandFileSession::execute_for_transfer_metadata(const std::string& query,
                                                                  const std::optional<std::string>& single_file) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
  }
  log_debug(nullptr, "Replaying {} for '{}'{}", command_file_.string(), query,
            single_file ? " scoped to " + *single_file : std::string());
  TransferCommand command = load_transfer_command(command_file_);
  if(single_file) command.src_locations = {*single_file};
  return command;
}

std::size_t CommandFileSession::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}
