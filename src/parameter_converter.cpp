#include "parameter_converter.h"

#include <cmath>
#include <limits>

#include "string_utils.h"

namespace {

constexpr size_t kPromptDisplayLength = 25;

bool ToDouble(const AxisValue& value, double* out) {
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    *out = static_cast<double>(*integer);
    return true;
  }
  if (const auto* seed = std::get_if<uint64_t>(&value)) {
    *out = static_cast<double>(*seed);
    return true;
  }
  if (const auto* real = std::get_if<double>(&value)) {
    if (!std::isfinite(*real)) {
      return false;
    }
    *out = *real;
    return true;
  }
  return xyz::ParseDouble(std::get<std::string>(value), out);
}

// Truncates toward zero; rejects values outside the int64 range.
bool TruncateToInt64(double value, int64_t* out) {
  if (!std::isfinite(value)) {
    return false;
  }
  const double truncated = std::trunc(value);
  if (truncated < -9.2233720368547758e18 || truncated >= 9.2233720368547758e18) {
    return false;
  }
  *out = static_cast<int64_t>(truncated);
  return true;
}

// Truncates toward zero; rejects negatives and values past the uint64 range.
bool TruncateToUInt64(double value, uint64_t* out) {
  if (!std::isfinite(value)) {
    return false;
  }
  const double truncated = std::trunc(value);
  if (truncated < 0.0 || truncated >= 1.8446744073709552e19) {
    return false;
  }
  *out = static_cast<uint64_t>(truncated);
  return true;
}

bool ToInt64(const AxisValue& value, int64_t* out) {
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    *out = *integer;
    return true;
  }
  if (const auto* seed = std::get_if<uint64_t>(&value)) {
    if (*seed > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return false;
    }
    *out = static_cast<int64_t>(*seed);
    return true;
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    if (xyz::ParseInt64(*text, out)) {
      return true;
    }
  }
  double real = 0.0;
  if (!ToDouble(value, &real)) {
    return false;
  }
  return TruncateToInt64(real, out);
}

bool ToUInt64(const AxisValue& value, uint64_t* out) {
  if (const auto* seed = std::get_if<uint64_t>(&value)) {
    *out = *seed;
    return true;
  }
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    if (*integer < 0) {
      return false;
    }
    *out = static_cast<uint64_t>(*integer);
    return true;
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    if (xyz::ParseUInt64(*text, out)) {
      return true;
    }
  }
  double real = 0.0;
  if (!ToDouble(value, &real)) {
    return false;
  }
  return TruncateToUInt64(real, out);
}

double RoundTo2(double value) {
  return std::round(value * 100.0) / 100.0;
}

// Seed ranges written as plain integers are expanded exactly, without a trip
// through double.
bool ParseSeedRange(const std::vector<std::string>& parts, std::vector<AxisValue>* values) {
  uint64_t start = 0;
  uint64_t stop = 0;
  uint64_t step = 1;
  if (!xyz::ParseUInt64(parts[0], &start) || !xyz::ParseUInt64(parts[1], &stop)) {
    return false;
  }
  if (parts.size() == 3 && !xyz::ParseUInt64(parts[2], &step)) {
    return false;
  }
  values->clear();
  if (step == 0 || stop < start) {
    return true;
  }
  const uint64_t span = (stop - start) / step;
  if (span >= static_cast<uint64_t>(kMaxRangeValues)) {
    return true;
  }
  for (uint64_t i = 0; i <= span; ++i) {
    values->emplace_back(start + i * step);
  }
  return true;
}

std::vector<AxisValue> ParseRange(const std::string& text, AxisType type) {
  const std::vector<std::string> parts = xyz::Split(text, ':');
  if (parts.size() != 2 && parts.size() != 3) {
    return {};
  }
  if (type == AxisType::Seed) {
    std::vector<AxisValue> seeds;
    if (ParseSeedRange(parts, &seeds)) {
      return seeds;
    }
  }
  double start = 0.0;
  double stop = 0.0;
  double step = 1.0;
  if (!xyz::ParseDouble(parts[0], &start) || !xyz::ParseDouble(parts[1], &stop)) {
    return {};
  }
  if (parts.size() == 3 && !xyz::ParseDouble(parts[2], &step)) {
    return {};
  }
  if (step <= 0.0 || stop < start) {
    return {};
  }
  // Count from the span instead of accumulating the step so that float
  // ranges such as 0.1:1.0:0.1 keep their inclusive end point.
  const double span = (stop - start) / step;
  if (span >= static_cast<double>(kMaxRangeValues)) {
    return {};
  }
  const size_t count = static_cast<size_t>(std::floor(span + 1e-9)) + 1;

  std::vector<AxisValue> values;
  values.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const double current = start + static_cast<double>(i) * step;
    if (type == AxisType::Seed) {
      uint64_t seed = 0;
      if (TruncateToUInt64(current, &seed)) {
        values.emplace_back(seed);
      }
    } else if (IsIntegerAxis(type)) {
      int64_t integer = 0;
      if (TruncateToInt64(current, &integer)) {
        values.emplace_back(integer);
      }
    } else {
      values.emplace_back(RoundTo2(current));
    }
  }
  return values;
}

std::vector<AxisValue> ParseNumericList(const std::string& text, AxisType type) {
  std::vector<AxisValue> values;
  for (const auto& raw : xyz::Split(text, ',')) {
    const std::string token = xyz::Trim(raw);
    if (token.empty()) {
      continue;
    }
    if (type == AxisType::Seed) {
      uint64_t seed = 0;
      if (ToUInt64(AxisValue(token), &seed)) {
        values.emplace_back(seed);
      }
    } else if (IsIntegerAxis(type)) {
      int64_t integer = 0;
      if (ToInt64(AxisValue(token), &integer)) {
        values.emplace_back(integer);
      }
    } else {
      double real = 0.0;
      if (xyz::ParseDouble(token, &real)) {
        values.emplace_back(real);
      }
    }
  }
  return values;
}

}  // namespace

std::vector<AxisValue> ParseValueString(const std::string& text, AxisType type) {
  if (xyz::Trim(text).empty()) {
    return {};
  }

  std::vector<AxisValue> values;
  if (IsNumericAxis(type)) {
    if (text.find(':') != std::string::npos) {
      values = ParseRange(text, type);
    } else {
      values = ParseNumericList(text, type);
    }
  } else {
    for (const auto& raw : xyz::Split(text, ',')) {
      const std::string token = xyz::Trim(raw);
      if (!token.empty()) {
        values.emplace_back(token);
      }
    }
  }

  if (values.empty()) {
    if (type == AxisType::Sampler) {
      values.emplace_back(std::string("euler"));
    } else if (type == AxisType::Scheduler) {
      values.emplace_back(std::string("simple"));
    }
  }
  return values;
}

AxisValue ConvertValue(const AxisValue& value, AxisType type) {
  switch (GetOutputType(type)) {
    case OutputType::Int: {
      if (type == AxisType::Seed) {
        uint64_t seed = 0;
        if (!ToUInt64(value, &seed)) {
          return uint64_t{0};
        }
        return seed;
      }
      int64_t integer = 0;
      if (!ToInt64(value, &integer)) {
        return int64_t{0};
      }
      return integer;
    }
    case OutputType::Float: {
      double real = 0.0;
      if (!ToDouble(value, &real)) {
        return 0.0;
      }
      return real;
    }
    case OutputType::String:
    default:
      if (type == AxisType::None) {
        return value;
      }
      return AxisValueToString(value);
  }
}

std::string FormatForDisplay(const AxisValue& value, AxisType type) {
  switch (type) {
    case AxisType::Model:
    case AxisType::Vae:
    case AxisType::Lora:
      return xyz::PathStem(AxisValueToString(value));
    case AxisType::Prompt: {
      const std::string text = AxisValueToString(value);
      if (text.size() > kPromptDisplayLength) {
        return text.substr(0, kPromptDisplayLength) + "...";
      }
      return text;
    }
    case AxisType::CfgScale:
    case AxisType::FluxGuidance:
    case AxisType::Denoise:
      return xyz::FormatFixed(std::get<double>(ConvertValue(value, type)), 1);
    case AxisType::Seed:
      return xyz::FormatThousands(std::get<uint64_t>(ConvertValue(value, type)));
    default:
      return AxisValueToString(value);
  }
}

ValidationResult ValidateValue(const AxisValue& value, AxisType type) {
  ValidationResult result;
  const std::string text = AxisValueToString(value);
  if (type == AxisType::Steps || type == AxisType::ClipSkip) {
    int64_t integer = 0;
    if (!ToInt64(value, &integer)) {
      result.ok = false;
      result.error = "Invalid integer value: " + text;
    } else if (integer < 1) {
      result.ok = false;
      result.error = "Value must be positive (got " + std::to_string(integer) + ")";
    }
  } else if (type == AxisType::CfgScale) {
    double real = 0.0;
    if (!ToDouble(value, &real)) {
      result.ok = false;
      result.error = "Invalid float value: " + text;
    } else if (real < 0.0) {
      result.ok = false;
      result.error = "CFG scale must be non-negative (got " + AxisValueToString(real) + ")";
    }
  } else if (type == AxisType::Denoise) {
    double real = 0.0;
    if (!ToDouble(value, &real)) {
      result.ok = false;
      result.error = "Invalid float value: " + text;
    } else if (real < 0.0 || real > 1.0) {
      result.ok = false;
      result.error = "Denoise must be between 0 and 1 (got " + AxisValueToString(real) + ")";
    }
  }
  return result;
}
