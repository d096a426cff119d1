#ifndef AXIS_TYPE_H
#define AXIS_TYPE_H

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// Parameter kinds an axis can sweep over.
enum class AxisType {
  None,
  Model,
  Vae,
  Lora,
  Sampler,
  Scheduler,
  CfgScale,
  Steps,
  Seed,
  Denoise,
  ClipSkip,
  Prompt,
  FluxGuidance,
};

// Which typed output of the controller carries an axis value.
enum class OutputType {
  String,
  Int,
  Float,
};

// A single axis value. The alternative always matches GetOutputType() of the
// axis it belongs to once it has passed through ConvertValue(). Seeds span the
// full unsigned 64-bit range and are held as uint64_t; other integer axes use
// int64_t.
using AxisValue = std::variant<std::string, int64_t, uint64_t, double>;

struct NumericDefaults {
  double default_value = 0.0;
  double min_value = 0.0;
  double max_value = 0.0;
  double step = 0.0;  // 0 = no preferred step
};

const std::vector<AxisType>& AllAxisTypes();

bool IsAxisTypeToken(const std::string& text);
bool ParseAxisTypeToken(const std::string& text, AxisType* out);
// Unknown tokens map to AxisType::None.
AxisType ParseAxisType(const std::string& text);
std::string AxisTypeToken(AxisType type);
std::string AxisTypeDisplayName(AxisType type);

OutputType GetOutputType(AxisType type);
std::string OutputTypeName(OutputType type);

// Numeric axes accept start:stop[:step] range syntax.
bool IsNumericAxis(AxisType type);
bool IsIntegerAxis(AxisType type);
bool IsFloatAxis(AxisType type);
bool GetNumericDefaults(AxisType type, NumericDefaults* out);

OutputType AxisValueType(const AxisValue& value);
std::string AxisValueToString(const AxisValue& value);

#endif  // AXIS_TYPE_H
