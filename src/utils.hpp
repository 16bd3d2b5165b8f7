#pragma once
#include <filesystem>
#include <string>
#include <vector>

std::string base64_from_bytes(const std::vector<unsigned char>&);

std::vector<unsigned char> sha256_bytes(const std::vector<char>& data);
// Streams the file; throws std::runtime_error when it cannot be read.
std::vector<unsigned char> sha256_file(const std::filesystem::path& path);

// Random lowercase alphanumeric token, used for scratch directory names.
std::string random_token(std::size_t length);
