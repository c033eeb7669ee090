#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace slidesearch {

// ISO 8601 timestamp
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

bool ends_with(const std::string& s, const std::string& suffix);

// Lowercase alphanumeric tokens, splitting on everything else
std::vector<std::string> tokenize(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path via a temp file + rename. Creates parent directories.
// Returns false if the file could not be written.
bool atomic_write_file(const std::string& path, const std::string& content);

// 64-bit FNV-1a
uint64_t fnv1a_64(const std::string& s);

// Shorten text for log lines ("abc..." past max_len bytes)
std::string truncate_for_log(const std::string& text, size_t max_len = 80);

} // namespace slidesearch
