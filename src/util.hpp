#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace graphmem {

// ISO 8601 timestamp with milliseconds for an epoch-millisecond value
std::string format_timestamp_ms(int64_t epoch_ms);

// Unix epoch milliseconds
int64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write a file via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace graphmem
