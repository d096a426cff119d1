#include "grid_controller.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "axis_labels.h"
#include "execution_state.h"
#include "log_service.h"
#include "parameter_converter.h"
#include "string_utils.h"

namespace {

constexpr const char* kLogCategory = "controller";

bool BuildAxis(const AxisInput& input,
               const char* name,
               bool include_param_name,
               bool value_only_labels,
               AxisSpec* axis,
               std::string* error,
               LogService* log) {
  const std::string token = xyz::ToLower(xyz::Trim(input.type));
  AxisType type = AxisType::None;
  if (!token.empty() && !ParseAxisTypeToken(token, &type)) {
    if (error) {
      *error = std::string("unknown axis type '") + input.type + "' for " + name + " axis";
    }
    return false;
  }

  axis->type = type;
  axis->label_prefix = input.label_prefix;
  if (type == AxisType::None) {
    axis->values = {AxisValue(std::string())};
    axis->labels.clear();
    return true;
  }

  axis->values = ParseValueString(input.values, type);
  if (axis->values.empty()) {
    if (error) {
      *error = std::string(name) + " axis (" + AxisTypeToken(type) + ") has no values";
    }
    return false;
  }
  if (log) {
    for (const auto& value : axis->values) {
      const ValidationResult check = ValidateValue(value, type);
      if (!check.ok) {
        log->Warning(kLogCategory, std::string(name) + " axis: " + check.error);
      }
    }
  }
  axis->labels = BuildAxisLabels(axis->values, type, input.label_prefix, include_param_name,
                                 value_only_labels);
  return true;
}

}  // namespace

AxisOutput MakeAxisOutput(const AxisValue& value, AxisType type, int index) {
  AxisOutput out;
  out.index = index;
  out.type = GetOutputType(type);
  if (type == AxisType::None) {
    out.string_value = AxisValueToString(value);
    return out;
  }
  const AxisValue typed = ConvertValue(value, type);
  out.string_value = AxisValueToString(typed);
  if (const auto* integer = std::get_if<int64_t>(&typed)) {
    out.int_value = *integer;
    out.uint_value = *integer < 0 ? 0 : static_cast<uint64_t>(*integer);
    out.float_value = static_cast<double>(*integer);
  } else if (const auto* seed = std::get_if<uint64_t>(&typed)) {
    const uint64_t int64_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    out.uint_value = *seed;
    out.int_value = static_cast<int64_t>(std::min(*seed, int64_max));
    out.float_value = static_cast<double>(*seed);
  } else if (const auto* real = std::get_if<double>(&typed)) {
    out.float_value = *real;
    out.int_value = static_cast<int64_t>(std::trunc(*real));
  }
  return out;
}

bool BuildGridConfiguration(const GridControllerRequest& request,
                            GridConfiguration* config,
                            std::string* error,
                            LogService* log) {
  if (!config) {
    if (error) {
      *error = "missing config output";
    }
    return false;
  }
  GridConfiguration built;
  if (!BuildAxis(request.x, "X", request.include_param_name, request.value_only_labels,
                 &built.axes.x, error, log)) {
    return false;
  }
  if (!BuildAxis(request.y, "Y", request.include_param_name, request.value_only_labels,
                 &built.axes.y, error, log)) {
    return false;
  }
  if (!BuildAxis(request.z, "Z", request.include_param_name, request.value_only_labels,
                 &built.axes.z, error, log)) {
    return false;
  }
  if (!built.axes.x.IsConfigured() && !built.axes.y.IsConfigured()) {
    if (error) {
      *error = "at least one axis (X or Y) must be configured";
    }
    return false;
  }

  built.batch_id = request.batch_id.empty() ? CreateUniqueId() : request.batch_id;
  built.dimensions =
      CalculateGridDimensions(built.axes.x.EffectiveCount(), built.axes.y.EffectiveCount(),
                              built.axes.z.EffectiveCount());
  if (!ValidateGridConfiguration(built, error)) {
    return false;
  }
  *config = std::move(built);
  return true;
}

ControllerResult ConfigureGrid(const GridControllerRequest& request,
                               ExecutionManager* manager,
                               LogService* log) {
  ControllerResult result;
  if (!manager) {
    result.error = "missing execution manager";
    return result;
  }
  if (!BuildGridConfiguration(request, &result.config, &result.error, log)) {
    if (log) {
      log->Error(kLogCategory, result.error);
    }
    return result;
  }

  const GridAxes& axes = result.config.axes;
  const CurrentValues current = manager->GetCurrentValues(result.config.batch_id, axes.x.values,
                                                          axes.y.values, axes.z.values);
  result.x = MakeAxisOutput(current.x_value, axes.x.type, current.x_index);
  result.y = MakeAxisOutput(current.y_value, axes.y.type, current.y_index);
  result.z = MakeAxisOutput(current.z_value, axes.z.type, current.z_index);
  result.batch_id = result.config.batch_id;
  result.ok = true;
  return result;
}
