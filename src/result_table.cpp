#include "result_table.hpp"

#include <algorithm>
#include <sstream>

#include "transfer_error.hpp"

namespace {

std::string compression_name(const FileTransferRecord& record, const CompressionType& type) {
  // GET never learns the compression of what it fetched.
  if(record.kind == CommandKind::Download) return std::string();
  return type.name;
}

std::vector<std::string> cells(const ResultRow& row) {
  return {
    row.src_file_name, row.dest_file_name,
    std::to_string(row.src_file_size), std::to_string(row.dest_file_size),
    row.status, row.message, row.source_compression, row.target_compression
  };
}

} // namespace

bool ResultTable::has_errors() const {
  return std::any_of(rows.begin(), rows.end(), [](const ResultRow& row) {
    return row.status == to_string(ResultStatus::Error);
  });
}

ResultTable build_result_table(const std::vector<FileTransferRecord>& records) {
  ResultTable table;
  table.rows.reserve(records.size());
  for(const auto& record : records) {
    if(!record.result_status) {
      throw TransferError(TransferErrorCode::Internal, record.src_file_name + " has no result status");
    }
    if(!is_terminal(*record.result_status)) {
      throw TransferError(TransferErrorCode::Internal,
                          record.src_file_name + " finished with transient status " +
                          to_string(*record.result_status));
    }
    ResultRow row;
    row.src_file_name = record.src_file_name;
    row.dest_file_name = record.dest_file_name;
    row.src_file_size = record.src_file_size;
    row.dest_file_size = record.dest_file_size;
    row.status = to_string(*record.result_status);
    row.message = record.last_error;
    row.source_compression = compression_name(record, record.source_compression);
    row.target_compression = compression_name(record, record.target_compression);
    table.rows.push_back(std::move(row));
  }
  return table;
}

nlohmann::json to_json(const ResultTable& table) {
  nlohmann::json rows = nlohmann::json::array();
  for(const auto& row : table.rows) {
    rows.push_back({
      {"source", row.src_file_name},
      {"target", row.dest_file_name},
      {"source_size", row.src_file_size},
      {"target_size", row.dest_file_size},
      {"status", row.status},
      {"message", row.message},
      {"source_compression", row.source_compression},
      {"target_compression", row.target_compression}
    });
  }
  return rows;
}

std::string render_text(const ResultTable& table) {
  std::array<std::size_t, 8> widths{};
  for(std::size_t i = 0; i < widths.size(); ++i) widths[i] = std::string(ResultTable::kColumns[i]).size();
  for(const auto& row : table.rows) {
    auto values = cells(row);
    for(std::size_t i = 0; i < widths.size(); ++i) widths[i] = std::max(widths[i], values[i].size());
  }

  std::ostringstream out;
  auto emit = [&](const std::vector<std::string>& values) {
    for(std::size_t i = 0; i < values.size(); ++i) {
      out << (i ? " | " : "") << values[i];
      if(i + 1 < values.size()) out << std::string(widths[i] - values[i].size(), ' ');
    }
    out << "\n";
  };

  emit(std::vector<std::string>(ResultTable::kColumns.begin(), ResultTable::kColumns.end()));
  std::size_t rule = 0;
  for(auto w : widths) rule += w;
  out << std::string(rule + 3 * (widths.size() - 1), '-') << "\n";
  for(const auto& row : table.rows) emit(cells(row));
  return out.str();
}
