#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <cstdint>
#include <string>
#include <vector>

namespace xyz {

// Trim leading and trailing whitespace.
std::string Trim(const std::string& text);

// Lowercase a string (ASCII-safe).
std::string ToLower(const std::string& text);

// Split on a single delimiter. Empty fields are kept.
std::vector<std::string> Split(const std::string& input, char delimiter);

// Strict numeric parsing: the whole (trimmed) token must be consumed.
bool ParseDouble(const std::string& text, double* out);
bool ParseInt64(const std::string& text, int64_t* out);
// No sign allowed; covers the full [0, 2^64 - 1] range.
bool ParseUInt64(const std::string& text, uint64_t* out);
// ParseInt64 restricted to the int range.
bool ParseInt(const std::string& text, int* out);

// "1234567" -> "1,234,567"
std::string FormatThousands(int64_t value);
std::string FormatThousands(uint64_t value);

std::string FormatFixed(double value, int precision);

// "models/sd/v1-5.safetensors" -> "v1-5"
std::string PathStem(const std::string& path);

// Cut to max_length characters, the last three replaced by "...".
std::string TruncateWithEllipsis(const std::string& text, size_t max_length);

}  // namespace xyz

#endif  // STRING_UTILS_H
