#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace curbench {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Unix epoch seconds
uint64_t epoch_seconds();

// Format epoch seconds as YYYY-MM-DD (UTC)
std::string format_date(int64_t epoch);

// Parse "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SSZ" (UTC). Returns false on malformed input.
bool parse_date(const std::string& s, int64_t& epoch_out);

// Trim whitespace
std::string trim(const std::string& s);

// Split string on any of the given delimiter characters
std::vector<std::string> split_any(const std::string& s, const std::string& delims);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to path.tmp then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// 64-bit FNV-1a over a list of fields, with a separator byte between them.
uint64_t fnv1a_fields(const std::vector<std::string>& fields);

// Lowercase 16-char hex rendering of a 64-bit value
std::string to_hex(uint64_t value);

// Round to nearest integer; exact halves round up (66.5 -> 67)
long round_half_up(double value);

} // namespace curbench
