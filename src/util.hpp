#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace toolrelay {

// ISO 8601 timestamp with millisecond precision
std::string timestamp_now();

// Milliseconds on the monotonic clock
int64_t monotonic_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Shorten text for log lines, appending "..." when cut
std::string truncate(const std::string& s, size_t max_len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace toolrelay
