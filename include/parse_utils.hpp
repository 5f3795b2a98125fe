#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB, GB or TB (case-insensitive);
// the single-letter forms K, M, G and T are accepted too.
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a boolean setting from a configuration file.
// Accepted (case-insensitive): true/false, yes/no, on/off, 1/0. An empty value means true.
// Invalid input sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
