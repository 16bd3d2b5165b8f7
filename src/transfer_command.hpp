#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "transfer_types.hpp"

// PUT/GET response document as returned by the server:
// {
//   "command": "UPLOAD" | "DOWNLOAD",
//   "src_locations": [...],
//   "stageInfo": {"locationType", "location", "path", "region", "endPoint",
//                 "storageAccount", "creds": {...}, "presignedUrl"},
//   "threshold", "parallel", "autoCompress", "sourceCompression", "overwrite",
//   "encryptionMaterial": object | [object | null, ...] | null,
//   "localLocation", "presignedUrls": [...], "srcFileSizes": [...]
// }
TransferCommand parse_transfer_command(const nlohmann::json& doc);
nlohmann::json to_json(const TransferCommand& command);

TransferCommand load_transfer_command(const std::filesystem::path& path);
