#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace xyz {

std::string Trim(const std::string& input) {
  size_t start = 0;
  while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
    ++start;
  }
  size_t end = input.size();
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }
  return input.substr(start, end - start);
}

std::string ToLower(const std::string& input) {
  std::string out = input;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::vector<std::string> Split(const std::string& input, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    const size_t pos = input.find(delimiter, start);
    if (pos == std::string::npos) {
      parts.push_back(input.substr(start));
      break;
    }
    parts.push_back(input.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

bool ParseDouble(const std::string& text, double* out) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE || !std::isfinite(parsed)) {
    return false;
  }
  if (out) {
    *out = parsed;
  }
  return true;
}

bool ParseInt64(const std::string& text, int64_t* out) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const long long parsed = std::strtoll(trimmed.c_str(), &end, 10);
  if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE) {
    return false;
  }
  if (out) {
    *out = static_cast<int64_t>(parsed);
  }
  return true;
}

bool ParseUInt64(const std::string& text, uint64_t* out) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty() || !std::isdigit(static_cast<unsigned char>(trimmed[0]))) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long parsed = std::strtoull(trimmed.c_str(), &end, 10);
  if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE) {
    return false;
  }
  if (out) {
    *out = static_cast<uint64_t>(parsed);
  }
  return true;
}

bool ParseInt(const std::string& text, int* out) {
  int64_t parsed = 0;
  if (!ParseInt64(text, &parsed) || parsed < std::numeric_limits<int>::min() ||
      parsed > std::numeric_limits<int>::max()) {
    return false;
  }
  if (out) {
    *out = static_cast<int>(parsed);
  }
  return true;
}

std::string FormatThousands(int64_t value) {
  if (value >= 0) {
    return FormatThousands(static_cast<uint64_t>(value));
  }
  // Magnitude computed unsigned so INT64_MIN does not overflow.
  return "-" + FormatThousands(static_cast<uint64_t>(-(value + 1)) + 1u);
}

std::string FormatThousands(uint64_t value) {
  const std::string digits = std::to_string(value);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);
  const size_t lead = digits.size() % 3;
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && i >= lead && (i - lead) % 3 == 0) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return out;
}

std::string FormatFixed(double value, int precision) {
  std::ostringstream out;
  out << std::setprecision(precision) << std::fixed << value;
  return out.str();
}

std::string PathStem(const std::string& path) {
  const size_t slash = path.find_last_of("/\\");
  std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  const size_t dot = name.find_last_of('.');
  if (dot != std::string::npos && dot != 0) {
    name.erase(dot);
  }
  return name;
}

std::string TruncateWithEllipsis(const std::string& text, size_t max_length) {
  if (text.size() <= max_length) {
    return text;
  }
  if (max_length <= 3) {
    return text.substr(0, max_length);
  }
  return text.substr(0, max_length - 3) + "...";
}

}  // namespace xyz
