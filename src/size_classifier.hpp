#pragma once

#include <cstdint>
#include <vector>

#include "transfer_types.hpp"

struct SizeBuckets {
  std::vector<FileTransferRecord> small;
  std::vector<FileTransferRecord> large;
};

// A record is large iff its source size is strictly greater than the threshold.
// Relative order inside each bucket follows the input order.
SizeBuckets classify_by_size(std::vector<FileTransferRecord> records, int64_t threshold);
