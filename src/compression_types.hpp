#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct CompressionType {
  std::string name;
  std::string file_extension;
  bool supported = true;

  bool is_none() const { return name == "NONE"; }
  bool operator==(const CompressionType& other) const { return name == other.name; }
  bool operator!=(const CompressionType& other) const { return !(*this == other); }
};

namespace compression {

inline const std::string kAutoDetect = "auto_detect";

const CompressionType& none();
const CompressionType& gzip();

// Every type the stage service knows about, supported or not.
const std::vector<CompressionType>& known_types();

std::optional<CompressionType> lookup_by_name(const std::string& name);
std::optional<CompressionType> lookup_by_extension(const std::string& extension);

// Magic bytes first, then the file extension. Returns NONE when nothing matches.
CompressionType guess_from_bytes(const std::vector<char>& head, const std::string& file_name);
CompressionType guess_from_file(const std::filesystem::path& path);

// Resolves the declared source compression of a PUT: "auto_detect" sniffs the payload,
// anything else is looked up by name. Unknown or unsupported types are batch-fatal.
CompressionType resolve_source_compression(const std::string& declared,
                                           const std::filesystem::path& path,
                                           const std::vector<char>* stream_buffer = nullptr);

} // namespace compression
