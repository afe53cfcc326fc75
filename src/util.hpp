#pragma once
#include <string>
#include <map>
#include <cstdint>

namespace hookgate {

// ISO 8601 timestamp (UTC, second precision)
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Case-insensitive substring test; needle must already be lower-case
bool contains_ci(const std::string& haystack, const std::string& lower_needle);

// Percent-decoding with '+' as space (application/x-www-form-urlencoded)
std::string url_decode(const std::string& s);

// Parse "a=1&b=2" into a map. Repeated keys: last wins.
std::map<std::string, std::string> parse_query_string(const std::string& qs);

// Replace every invalid UTF-8 sequence with U+FFFD
std::string sanitize_utf8(const std::string& s);

// Parse a decimal string made only of digits. Returns false on any other
// character, on an empty string, or when the value exceeds max_value.
bool parse_unsigned(const std::string& s, uint64_t max_value, uint64_t& out);

// Lower-case hex encoding
std::string hex_encode(const unsigned char* data, size_t len);

} // namespace hookgate
