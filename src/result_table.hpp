#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "transfer_types.hpp"

struct ResultRow {
  std::string src_file_name;
  std::string dest_file_name;
  int64_t src_file_size = 0;
  int64_t dest_file_size = 0;
  std::string status;
  std::string message;
  std::string source_compression;
  std::string target_compression;
};

struct ResultTable {
  static constexpr std::array<const char*, 8> kColumns = {
    "source", "target", "source_size", "target_size",
    "status", "message", "source_compression", "target_compression"
  };

  std::vector<ResultRow> rows;

  bool has_errors() const;
};

// One row per record, in the order given. A record that never reached a terminal
// status is an executor bug and throws Internal.
ResultTable build_result_table(const std::vector<FileTransferRecord>& records);

nlohmann::json to_json(const ResultTable& table);
std::string render_text(const ResultTable& table);
