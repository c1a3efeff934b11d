#pragma once
#include <string>
#include <cstdint>

namespace chansync {

// ISO 8601 timestamp (UTC, second precision)
std::string timestamp_now();

// Unix epoch milliseconds
int64_t epoch_ms();

// Trim whitespace
std::string trim(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Client-side correlation id for optimistic messages ("c-" + 16 hex chars)
std::string generate_client_id();

// True for canonical 8-4-4-4-12 hex UUID strings (server-assigned ids)
bool is_uuid(const std::string& s);

// Percent-encode for use in a URL query component
std::string url_encode(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories as needed.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace chansync
