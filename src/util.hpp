#pragma once
#include <string>
#include <cstdint>
#include <optional>

namespace chanview {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Percent-encode everything except RFC 3986 unreserved characters
std::string url_encode(const std::string& s);

// Drop HTML markup from a short summary: paragraph/line breaks become
// newlines, a few entities are decoded, remaining tags removed.
std::string strip_html(const std::string& html);

// Parse a whole string as a signed integer (surrounding whitespace allowed)
std::optional<int64_t> parse_int64(const std::string& s);

// Truncate a double toward zero; nullopt when not finite or outside int64 range
std::optional<int64_t> double_to_int64(double v);

// "HH:MM" of a unix timestamp, UTC
std::string format_utc_hhmm(int64_t unix_seconds);

// Local calendar date "YYYY-MM-DD" for a unix timestamp
std::string local_date(int64_t unix_seconds);

// Shift a "YYYY-MM-DD" date by whole days (calendar arithmetic, no timezone)
std::string add_days(const std::string& ymd, int days);

} // namespace chanview
