#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chatrelay {

// ISO 8601 timestamp, UTC, millisecond precision (e.g. 2025-01-02T03:04:05.678Z)
std::string timestamp_now();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Random UUID v4 from the OpenSSL CSPRNG. Throws if the generator fails.
std::string generate_uuid();

// Remove trailing '/' characters
std::string strip_trailing_slashes(const std::string& url);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// True for "1", "true", "yes" (case-insensitive)
bool is_truthy(const std::string& value);

} // namespace chatrelay
