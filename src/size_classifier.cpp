#include "size_classifier.hpp"

#include "log.hpp"

SizeBuckets classify_by_size(std::vector<FileTransferRecord> records, int64_t threshold) {
  SizeBuckets buckets;
  for(auto& record : records) {
    if(record.src_file_size > threshold) {
      buckets.large.push_back(std::move(record));
    } else {
      buckets.small.push_back(std::move(record));
    }
  }
  log_debug(nullptr, "Threshold {} bytes: {} small file(s), {} large file(s)",
            threshold, buckets.small.size(), buckets.large.size());
  return buckets;
}
