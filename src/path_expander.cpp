#include "path_expander.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

#include "log.hpp"
#include "transfer_error.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kPrefixExtensionLength = 3;

enum class EntryKind { Directory, RegularFile };

std::vector<fs::path> list_matching(const fs::path& base, const std::string& pattern, EntryKind kind) {
  std::vector<fs::path> out;
  std::error_code ec;
  fs::directory_iterator it(base, ec);
  if(ec) return out;
  for(const auto& entry : it) {
    std::error_code stat_ec;
    bool wanted = (kind == EntryKind::Directory)
      ? entry.is_directory(stat_ec)
      : entry.is_regular_file(stat_ec);
    if(stat_ec || !wanted) continue;
    std::string name = entry.path().filename().string();
    bool matched = (kind == EntryKind::Directory)
      ? glob_match(pattern, name)
      : wildcard_match(pattern, name);
    if(matched) out.push_back(entry.path());
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<fs::path> expand_by_segment(const fs::path& location) {
  std::vector<std::string> parts;
  for(const auto& component : location.relative_path()) {
    parts.push_back(component.string());
  }

  std::vector<fs::path> current{location.root_path()};
  for(std::size_t i = 0; i < parts.size(); ++i) {
    const std::string& part = parts[i];
    const bool last = (i + 1 == parts.size());
    std::vector<fs::path> next;
    for(const auto& base : current) {
      if(has_wildcard(part)) {
        auto matches = list_matching(base, part, last ? EntryKind::RegularFile : EntryKind::Directory);
        next.insert(next.end(), matches.begin(), matches.end());
      } else if(last) {
        std::error_code ec;
        if(fs::is_regular_file(base / part, ec)) next.push_back(base / part);
      } else {
        next.push_back(base / part);
      }
    }
    current = std::move(next);
    if(current.empty()) break;
  }
  return current;
}

} // namespace

std::string resolve_home_directory(const std::string& configured) {
  if(!configured.empty()) return configured;
  if(const char* env = std::getenv("HOME"); env && *env) return env;
  if(const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
  return "";
}

std::string expand_home(const std::string& location, const std::string& home) {
  if(location.empty() || location.front() != '~') return location;
  if(location.size() > 1 && location[1] != '/') return location;
  if(home.empty()) {
    throw TransferError(TransferErrorCode::InvalidInput,
                        "cannot expand '~' in " + location + ": home directory unknown");
  }
  return home + location.substr(1);
}

bool has_wildcard(const std::string& text) {
  return text.find_first_of("*?") != std::string::npos;
}

bool glob_match(const std::string& pattern, const std::string& name) {
  std::size_t p = 0;
  std::size_t n = 0;
  std::size_t star = std::string::npos;
  std::size_t resume = 0;
  while(n < name.size()) {
    if(p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
      ++p;
      ++n;
    } else if(p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = n;
    } else if(star != std::string::npos) {
      p = star + 1;
      n = ++resume;
    } else {
      return false;
    }
  }
  while(p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

bool wildcard_match(const std::string& pattern, const std::string& name) {
  auto pattern_dot = pattern.rfind('.');
  bool prefix_rule = pattern.find('*') != std::string::npos &&
                     pattern_dot != std::string::npos &&
                     pattern.size() - pattern_dot - 1 == kPrefixExtensionLength;
  if(!prefix_rule) return glob_match(pattern, name);

  auto name_dot = name.rfind('.');
  if(name_dot == std::string::npos) return false;
  std::string name_ext = name.substr(name_dot + 1);
  if(name_ext.size() < kPrefixExtensionLength) return false;
  return glob_match(pattern.substr(0, pattern_dot), name.substr(0, name_dot)) &&
         glob_match(pattern.substr(pattern_dot + 1), name_ext.substr(0, kPrefixExtensionLength));
}

std::vector<std::string> expand_file_names(const std::string& location, const std::string& home) {
  fs::path path = fs::absolute(fs::path(expand_home(location, home))).lexically_normal();
  const std::string directory = path.parent_path().string();
  const std::string file_name = path.filename().string();

  std::vector<fs::path> matches;
  if(has_wildcard(directory)) {
    matches = expand_by_segment(path);
  } else if(has_wildcard(file_name)) {
    std::error_code ec;
    if(!fs::is_directory(path.parent_path(), ec)) {
      throw TransferError(TransferErrorCode::FileNotFound,
                          "could not find a part of the path " + directory);
    }
    matches = list_matching(path.parent_path(), file_name, EntryKind::RegularFile);
  } else {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if(ec || !fs::exists(status)) {
      throw TransferError(TransferErrorCode::FileNotFound, "file not found: " + path.string());
    }
    if(fs::is_directory(status)) {
      throw TransferError(TransferErrorCode::NotAFile,
                          "directories not supported, you need to provide a file path: " + path.string());
    }
    matches.push_back(path);
  }

  std::vector<std::string> out;
  out.reserve(matches.size());
  log_debug(nullptr, "Expand {} into {} file(s)", location, matches.size());
  for(const auto& match : matches) {
    log_debug(nullptr, "\t{}", match.string());
    out.push_back(match.string());
  }
  return out;
}

std::vector<std::string> expand_all(const std::vector<std::string>& locations, const std::string& home) {
  std::vector<std::string> out;
  for(const auto& location : locations) {
    auto files = expand_file_names(location, home);
    out.insert(out.end(), files.begin(), files.end());
  }
  if(out.empty()) {
    throw TransferError(TransferErrorCode::NoFileFound,
                        "no file found for: " + (locations.empty() ? std::string() : locations.front()));
  }
  return out;
}
