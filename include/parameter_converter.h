// Conversion and formatting of axis values. All functions are pure and never
// throw: a malformed value inside an otherwise valid axis degrades to a safe
// default so that one bad cell cannot abort a long sweep.
#ifndef PARAMETER_CONVERTER_H
#define PARAMETER_CONVERTER_H

#include <string>
#include <vector>

#include "axis_type.h"

struct ValidationResult {
  bool ok = true;
  std::string error;
};

// Upper bound on the number of values a single range expression may expand to.
constexpr size_t kMaxRangeValues = 10000;

// Parse a comma-separated list, or for numeric axes a start:stop[:step] range
// (stop inclusive, default step 1). Integer axes truncate, float ranges round
// to 2 decimals. Malformed numeric tokens are skipped. Sampler and scheduler
// axes that yield nothing fall back to "euler" / "simple".
std::vector<AxisValue> ParseValueString(const std::string& text, AxisType type);

// Canonical typed value for the axis: string, int64 or double per
// GetOutputType(). Failures degrade to "", 0 or 0.0.
AxisValue ConvertValue(const AxisValue& value, AxisType type);

// Display label text for a value (no prefix, no truncation beyond prompts).
std::string FormatForDisplay(const AxisValue& value, AxisType type);

// Range checks: steps/clip_skip >= 1, cfg_scale >= 0, denoise in [0, 1].
ValidationResult ValidateValue(const AxisValue& value, AxisType type);

#endif  // PARAMETER_CONVERTER_H
