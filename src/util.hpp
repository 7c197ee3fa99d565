#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace memoria {

// Unix epoch seconds
uint64_t epoch_seconds();

// ISO 8601 timestamp for the given epoch seconds
std::string format_timestamp(uint64_t epoch);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8_length(const std::string& s);

// Cut to at most max_chars code points without splitting a multi-byte sequence
std::string utf8_truncate(const std::string& s, size_t max_chars);

// Copy with every byte that does not start a well-formed UTF-8 sequence
// (truncated, overlong, surrogate, out of range) replaced by U+FFFD
std::string utf8_sanitize(const std::string& s);

// Write to path.tmp then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace memoria
