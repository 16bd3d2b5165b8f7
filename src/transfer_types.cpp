#include "transfer_types.hpp"

#include <array>
#include <utility>

#include "transfer_error.hpp"

namespace {

const std::array<std::pair<ResultStatus, const char*>, 10> kStatusNames = {{
  {ResultStatus::Error, "ERROR"},
  {ResultStatus::Uploaded, "UPLOADED"},
  {ResultStatus::Downloaded, "DOWNLOADED"},
  {ResultStatus::Collision, "COLLISION"},
  {ResultStatus::Skipped, "SKIPPED"},
  {ResultStatus::NotFoundFile, "NOT_FOUND_FILE"},
  {ResultStatus::RenewToken, "RENEW_TOKEN"},
  {ResultStatus::RenewPresignedUrl, "RENEW_PRESIGNED_URL"},
  {ResultStatus::NeedRetry, "NEED_RETRY"},
  {ResultStatus::NeedRetryWithLowerConcurrency, "NEED_RETRY_WITH_LOWER_CONCURRENCY"}
}};

} // namespace

const char* to_string(CommandKind kind) {
  return kind == CommandKind::Upload ? "UPLOAD" : "DOWNLOAD";
}

const char* to_string(ResultStatus status) {
  for(const auto& entry : kStatusNames) {
    if(entry.first == status) return entry.second;
  }
  return "ERROR";
}

std::optional<ResultStatus> parse_result_status(const std::string& text) {
  for(const auto& entry : kStatusNames) {
    if(text == entry.second) return entry.first;
  }
  return std::nullopt;
}

bool is_terminal(ResultStatus status) {
  switch(status) {
    case ResultStatus::RenewToken:
    case ResultStatus::RenewPresignedUrl:
    case ResultStatus::NeedRetry:
    case ResultStatus::NeedRetryWithLowerConcurrency:
      return false;
    default:
      return true;
  }
}

void CancellationFlag::throw_if_cancelled(const std::string& context) const {
  if(cancelled()) {
    throw TransferError(TransferErrorCode::Cancelled, "transfer cancelled before " + context);
  }
}
