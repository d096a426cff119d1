#include "grid_config.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "json_fields.h"
#include "parameter_converter.h"

namespace {
using json = nlohmann::json;

json AxisSpecToJson(const AxisSpec& axis) {
  json out;
  out["type"] = AxisTypeToken(axis.type);
  json values = json::array();
  for (const auto& value : axis.values) {
    values.push_back(AxisValueToJson(value));
  }
  out["values"] = values;
  out["labels"] = axis.labels;
  out["label_prefix"] = axis.label_prefix;
  return out;
}

bool ParseAxisSpec(const json& j, const char* name, AxisSpec* axis, std::string* error) {
  if (!j.is_object()) {
    if (error) {
      *error = std::string("axes.") + name + " must be an object";
    }
    return false;
  }
  // A null type is accepted as "none".
  if (j.contains("type") && !j.at("type").is_null()) {
    std::string token;
    if (!ReadStringField(j, "type", &token, error)) return false;
    if (!ParseAxisTypeToken(token, &axis->type)) {
      if (error) {
        *error = std::string("unknown axis type '") + token + "' for axes." + name;
      }
      return false;
    }
  }
  if (j.contains("values")) {
    const json& values = j.at("values");
    if (!values.is_array()) {
      if (error) {
        *error = std::string("axes.") + name + ".values must be an array";
      }
      return false;
    }
    for (const auto& item : values) {
      AxisValue value;
      if (!AxisValueFromJson(item, &value, error)) {
        return false;
      }
      axis->values.push_back(axis->type == AxisType::None ? value
                                                          : ConvertValue(value, axis->type));
    }
  }
  if (j.contains("labels")) {
    const json& labels = j.at("labels");
    if (!labels.is_array()) {
      if (error) {
        *error = std::string("axes.") + name + ".labels must be an array";
      }
      return false;
    }
    for (const auto& item : labels) {
      if (!item.is_string()) {
        if (error) {
          *error = std::string("axes.") + name + ".labels must contain strings";
        }
        return false;
      }
      axis->labels.push_back(item.get<std::string>());
    }
  }
  return ReadStringField(j, "label_prefix", &axis->label_prefix, error);
}

bool ParseDimensions(const json& j, GridDimensions* dims, std::string* error) {
  if (!j.is_object()) {
    if (error) {
      *error = "dimensions must be an object";
    }
    return false;
  }
  if (!ReadIntField(j, "total_images", &dims->total_images, error)) return false;
  if (!ReadIntField(j, "cols", &dims->cols, error)) return false;
  if (!ReadIntField(j, "rows", &dims->rows, error)) return false;
  if (!ReadIntField(j, "grids_count", &dims->grids_count, error)) return false;
  return true;
}

bool ValidateAxis(const AxisSpec& axis, const char* name, std::string* error) {
  if (!axis.labels.empty() && axis.labels.size() != axis.values.size()) {
    if (error) {
      *error = std::string("axes.") + name + " has " + std::to_string(axis.labels.size()) +
               " labels for " + std::to_string(axis.values.size()) + " values";
    }
    return false;
  }
  return true;
}

}  // namespace

int AxisSpec::EffectiveCount() const {
  return std::max(1, static_cast<int>(values.size()));
}

json AxisValueToJson(const AxisValue& value) {
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    return *integer;
  }
  if (const auto* seed = std::get_if<uint64_t>(&value)) {
    return *seed;
  }
  if (const auto* real = std::get_if<double>(&value)) {
    return *real;
  }
  return std::get<std::string>(value);
}

bool AxisValueFromJson(const json& j, AxisValue* out, std::string* error) {
  if (j.is_string()) {
    *out = j.get<std::string>();
    return true;
  }
  if (j.is_number_unsigned()) {
    const uint64_t value = j.get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      *out = value;
    } else {
      *out = static_cast<int64_t>(value);
    }
    return true;
  }
  if (j.is_number_integer()) {
    *out = j.get<int64_t>();
    return true;
  }
  if (j.is_number_float()) {
    *out = j.get<double>();
    return true;
  }
  if (error) {
    *error = "axis values must be strings or numbers";
  }
  return false;
}

json GridConfigurationToJson(const GridConfiguration& config) {
  json root;
  root["batch_id"] = config.batch_id;

  json axes;
  axes["x"] = AxisSpecToJson(config.axes.x);
  axes["y"] = AxisSpecToJson(config.axes.y);
  axes["z"] = AxisSpecToJson(config.axes.z);
  root["axes"] = axes;

  json dims;
  dims["total_images"] = config.dimensions.total_images;
  dims["cols"] = config.dimensions.cols;
  dims["rows"] = config.dimensions.rows;
  dims["grids_count"] = config.dimensions.grids_count;
  root["dimensions"] = dims;
  return root;
}

bool GridConfigurationFromJson(const json& root, GridConfiguration* config, std::string* error) {
  if (!config) {
    if (error) {
      *error = "missing config output";
    }
    return false;
  }
  if (!root.is_object()) {
    if (error) {
      *error = "grid configuration must be a JSON object";
    }
    return false;
  }
  GridConfiguration parsed;
  if (!ReadStringField(root, "batch_id", &parsed.batch_id, error)) return false;

  if (!root.contains("axes") || !root.at("axes").is_object()) {
    if (error) {
      *error = "missing axes object";
    }
    return false;
  }
  const json& axes = root.at("axes");
  if (axes.contains("x") && !ParseAxisSpec(axes.at("x"), "x", &parsed.axes.x, error)) return false;
  if (axes.contains("y") && !ParseAxisSpec(axes.at("y"), "y", &parsed.axes.y, error)) return false;
  if (axes.contains("z") && !ParseAxisSpec(axes.at("z"), "z", &parsed.axes.z, error)) return false;

  if (root.contains("dimensions")) {
    if (!ParseDimensions(root.at("dimensions"), &parsed.dimensions, error)) return false;
  } else {
    parsed.dimensions.cols = parsed.axes.x.EffectiveCount();
    parsed.dimensions.rows = parsed.axes.y.EffectiveCount();
    parsed.dimensions.grids_count = parsed.axes.z.EffectiveCount();
    const int64_t total = static_cast<int64_t>(parsed.dimensions.cols) *
                          parsed.dimensions.rows * parsed.dimensions.grids_count;
    parsed.dimensions.total_images =
        static_cast<int>(std::min<int64_t>(total, std::numeric_limits<int>::max()));
  }

  if (!ValidateGridConfiguration(parsed, error)) {
    return false;
  }
  *config = std::move(parsed);
  return true;
}

std::string SerializeGridConfiguration(const GridConfiguration& config, int indent) {
  return GridConfigurationToJson(config).dump(indent);
}

bool LoadGridConfigurationFromString(const std::string& content,
                                     GridConfiguration* config,
                                     std::string* error) {
  json root;
  try {
    root = json::parse(content);
  } catch (const json::exception& e) {
    if (error) {
      *error = std::string("invalid JSON: ") + e.what();
    }
    return false;
  }
  return GridConfigurationFromJson(root, config, error);
}

bool ValidateGridConfiguration(const GridConfiguration& config, std::string* error) {
  if (config.batch_id.empty()) {
    if (error) {
      *error = "missing batch_id";
    }
    return false;
  }
  if (!ValidateAxis(config.axes.x, "x", error)) return false;
  if (!ValidateAxis(config.axes.y, "y", error)) return false;
  if (!ValidateAxis(config.axes.z, "z", error)) return false;

  const GridDimensions& dims = config.dimensions;
  if (dims.cols < 1 || dims.rows < 1 || dims.grids_count < 1) {
    if (error) {
      *error = "dimensions must be positive";
    }
    return false;
  }
  if (dims.cols != config.axes.x.EffectiveCount() ||
      dims.rows != config.axes.y.EffectiveCount() ||
      dims.grids_count != config.axes.z.EffectiveCount()) {
    if (error) {
      *error = "dimensions do not match axis value counts";
    }
    return false;
  }
  const int64_t product = static_cast<int64_t>(dims.cols) * dims.rows * dims.grids_count;
  if (product > kMaxGridImages) {
    if (error) {
      *error = "grid has " + std::to_string(product) + " images, more than the limit of " +
               std::to_string(kMaxGridImages);
    }
    return false;
  }
  if (dims.total_images != product) {
    if (error) {
      *error = "total_images must equal cols * rows * grids_count";
    }
    return false;
  }
  return true;
}
