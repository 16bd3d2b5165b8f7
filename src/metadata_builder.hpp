#pragma once

#include <string>
#include <vector>

#include "transfer_types.hpp"

// Stream upload takes exactly one source location.
void validate_stream_upload(const TransferCommand& command);

// One record per expanded local file (or the single stream). Throws
// UnsupportedCompression before any record is returned.
std::vector<FileTransferRecord> build_upload_records(const TransferCommand& command,
                                                     const std::vector<std::string>& files);

// One record per server-declared name; encryption materials are matched positionally
// and their count must equal the file count.
std::vector<FileTransferRecord> build_download_records(const TransferCommand& command);
