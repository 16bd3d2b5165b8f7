#include "compression_types.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"
#include "settings_manager.hpp"
#include "transfer_error.hpp"

namespace compression {

namespace {

constexpr std::size_t kSniffBytes = 16;

struct MagicSignature {
  const char* type_name;
  std::vector<unsigned char> bytes;
};

const std::vector<MagicSignature>& magic_signatures() {
  static const std::vector<MagicSignature> signatures = {
    {"GZIP",     {0x1f, 0x8b}},
    {"COMPRESS", {0x1f, 0x9d}},
    {"BZIP2",    {'B', 'Z', 'h'}},
    {"ZSTD",     {0x28, 0xb5, 0x2f, 0xfd}},
    {"XZ",       {0xfd, '7', 'z', 'X', 'Z', 0x00}},
    {"LZIP",     {'L', 'Z', 'I', 'P'}},
    {"PARQUET",  {'P', 'A', 'R', '1'}},
    {"ORC",      {'O', 'R', 'C'}}
  };
  return signatures;
}

bool starts_with_bytes(const std::vector<char>& head, const std::vector<unsigned char>& magic) {
  if(head.size() < magic.size()) return false;
  for(std::size_t i = 0; i < magic.size(); ++i) {
    if(static_cast<unsigned char>(head[i]) != magic[i]) return false;
  }
  return true;
}

std::string extension_of(const std::string& file_name) {
  auto dot = file_name.rfind('.');
  if(dot == std::string::npos || dot == 0) return "";
  return file_name.substr(dot);
}

} // namespace

const CompressionType& none() {
  static const CompressionType type{"NONE", "", true};
  return type;
}

const CompressionType& gzip() {
  static const CompressionType type{"GZIP", ".gz", true};
  return type;
}

const std::vector<CompressionType>& known_types() {
  static const std::vector<CompressionType> types = {
    gzip(),
    {"DEFLATE",     ".deflate",     true},
    {"RAW_DEFLATE", ".raw_deflate", true},
    {"BZIP2",       ".bz2",         true},
    {"ZSTD",        ".zst",         true},
    {"BROTLI",      ".br",          true},
    {"PARQUET",     ".parquet",     true},
    {"ORC",         ".orc",         true},
    {"LZIP",        ".lz",          false},
    {"LZMA",        ".lzma",        false},
    {"LZO",         ".lzo",         false},
    {"XZ",          ".xz",          false},
    {"COMPRESS",    ".Z",           false},
    none()
  };
  return types;
}

std::optional<CompressionType> lookup_by_name(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  for(const auto& type : known_types()) {
    if(type.name == upper) return type;
  }
  return std::nullopt;
}

std::optional<CompressionType> lookup_by_extension(const std::string& extension) {
  if(extension.empty()) return std::nullopt;
  // ".Z" is the only case-sensitive suffix
  for(const auto& type : known_types()) {
    if(!type.file_extension.empty() && type.file_extension == extension) return type;
  }
  std::string lowered = SettingsManager::to_lower(extension);
  for(const auto& type : known_types()) {
    if(type.file_extension == ".Z") continue;
    if(!type.file_extension.empty() && type.file_extension == lowered) return type;
  }
  return std::nullopt;
}

CompressionType guess_from_bytes(const std::vector<char>& head, const std::string& file_name) {
  for(const auto& signature : magic_signatures()) {
    if(starts_with_bytes(head, signature.bytes)) {
      if(auto type = lookup_by_name(signature.type_name)) return *type;
    }
  }
  if(auto type = lookup_by_extension(extension_of(file_name))) return *type;
  return none();
}

CompressionType guess_from_file(const std::filesystem::path& path) {
  std::vector<char> head(kSniffBytes);
  std::ifstream in(path, std::ios::binary);
  if(in) {
    in.read(head.data(), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<std::size_t>(std::max<std::streamsize>(0, in.gcount())));
  } else {
    head.clear();
  }
  return guess_from_bytes(head, path.filename().string());
}

CompressionType resolve_source_compression(const std::string& declared,
                                           const std::filesystem::path& path,
                                           const std::vector<char>* stream_buffer) {
  CompressionType resolved;
  if(SettingsManager::to_lower(declared) == kAutoDetect || declared.empty()) {
    if(stream_buffer) {
      std::vector<char> head(stream_buffer->begin(),
                             stream_buffer->begin() + static_cast<std::ptrdiff_t>(
                               std::min(kSniffBytes, stream_buffer->size())));
      resolved = guess_from_bytes(head, path.filename().string());
    } else {
      resolved = guess_from_file(path);
    }
    log_debug(nullptr, "File compression detected as {} for: {}", resolved.name, path.string());
  } else {
    auto named = lookup_by_name(declared);
    if(!named) {
      throw TransferError(TransferErrorCode::UnsupportedCompression,
                          "unknown source compression '" + declared + "'");
    }
    resolved = *named;
  }
  if(!resolved.supported) {
    throw TransferError(TransferErrorCode::UnsupportedCompression,
                        "feature not supported: compression " + resolved.name);
  }
  return resolved;
}

} // namespace compression
