#pragma once

#include <string>
#include <vector>

// Configured override first, then $HOME, then the passwd entry of the current user.
std::string resolve_home_directory(const std::string& configured = std::string());

// Replaces a leading "~" (alone or followed by '/') with the given home directory.
std::string expand_home(const std::string& location, const std::string& home);

bool has_wildcard(const std::string& text);

// '*' and '?' glob over a single path component.
bool glob_match(const std::string& pattern, const std::string& name);

// File-name wildcard rule used by PUT:
//  - a pattern containing '*' whose extension is exactly three characters matches any
//    extension beginning with it ("*.xls" matches "book.xls" and "book.xlsx");
//  - every other pattern must match the extension exactly ("*.ai" rejects "file.aif").
bool wildcard_match(const std::string& pattern, const std::string& name);

// Resolves one PUT source location into absolute file paths. A location without
// wildcards must name an existing regular file.
std::vector<std::string> expand_file_names(const std::string& location, const std::string& home);

// Expands every location in order; an empty aggregate is a batch-fatal NoFileFound.
std::vector<std::string> expand_all(const std::vector<std::string>& locations, const std::string& home);
