#include "sweep_config.h"

#include <utility>

#include <nlohmann/json.hpp>

#include "axis_type.h"
#include "json_fields.h"
#include "string_utils.h"

namespace {
using json = nlohmann::json;

bool IsExecutionModeToken(const std::string& token) {
  return token == "step" || token == "queue";
}

json AxisToJson(const SweepAxisConfig& axis) {
  json out;
  out["type"] = axis.type;
  out["values"] = axis.values;
  out["label_prefix"] = axis.label_prefix;
  return out;
}

bool ParseAxisJson(const json& j, const char* name, SweepAxisConfig* axis, std::string* error) {
  if (!j.is_object()) {
    if (error) {
      *error = std::string("expected object for axes.") + name;
    }
    return false;
  }
  if (!ReadStringField(j, "type", &axis->type, error)) return false;
  if (!ReadStringField(j, "values", &axis->values, error)) return false;
  if (!ReadStringField(j, "label_prefix", &axis->label_prefix, error)) return false;
  axis->type = xyz::ToLower(xyz::Trim(axis->type));
  return true;
}

bool CheckRange(int value, int min_value, int max_value, const char* key, std::string* error) {
  if (value < min_value || value > max_value) {
    if (error) {
      *error = std::string("grid.") + key + " must be in [" + std::to_string(min_value) + ", " +
               std::to_string(max_value) + "]";
    }
    return false;
  }
  return true;
}

json SweepConfigToJson(const SweepConfig& config) {
  json root;
  root["schema_version"] = config.schema_version;
  if (!config.batch_id.empty()) {
    root["batch_id"] = config.batch_id;
  }

  json axes;
  axes["x"] = AxisToJson(config.x);
  axes["y"] = AxisToJson(config.y);
  axes["z"] = AxisToJson(config.z);
  root["axes"] = axes;

  json labels;
  labels["include_param_name"] = config.include_param_name;
  labels["value_only_labels"] = config.value_only_labels;
  root["labels"] = labels;

  json grid;
  grid["font_size"] = config.grid.font_size;
  grid["grid_gap"] = config.grid.grid_gap;
  grid["label_height"] = config.grid.label_height;
  grid["max_label_length"] = config.grid.max_label_length;
  grid["include_labels"] = config.grid.include_labels;
  root["grid"] = grid;

  json execution;
  execution["mode"] = config.execution_mode;
  root["execution"] = execution;
  return root;
}

bool ParseSweepConfigJson(const json& root, SweepConfig* config, std::string* error) {
  if (!config) {
    if (error) {
      *error = "missing config output";
    }
    return false;
  }
  if (!root.is_object()) {
    if (error) {
      *error = "sweep config must be a JSON object";
    }
    return false;
  }
  SweepConfig parsed;
  if (!ReadIntField(root, "schema_version", &parsed.schema_version, error)) return false;
  if (parsed.schema_version != 1) {
    if (error) {
      *error = "unsupported schema_version";
    }
    return false;
  }
  if (!ReadStringField(root, "batch_id", &parsed.batch_id, error)) return false;

  if (root.contains("axes")) {
    const json& axes = root.at("axes");
    if (!axes.is_object()) {
      if (error) {
        *error = "expected object for axes";
      }
      return false;
    }
    if (axes.contains("x") && !ParseAxisJson(axes.at("x"), "x", &parsed.x, error)) return false;
    if (axes.contains("y") && !ParseAxisJson(axes.at("y"), "y", &parsed.y, error)) return false;
    if (axes.contains("z") && !ParseAxisJson(axes.at("z"), "z", &parsed.z, error)) return false;
  }

  if (root.contains("labels")) {
    const json& labels = root.at("labels");
    if (!ReadBoolField(labels, "include_param_name", &parsed.include_param_name, error)) {
      return false;
    }
    if (!ReadBoolField(labels, "value_only_labels", &parsed.value_only_labels, error)) {
      return false;
    }
  }

  if (root.contains("grid")) {
    const json& grid = root.at("grid");
    if (!ReadIntField(grid, "font_size", &parsed.grid.font_size, error)) return false;
    if (!ReadIntField(grid, "grid_gap", &parsed.grid.grid_gap, error)) return false;
    if (!ReadIntField(grid, "label_height", &parsed.grid.label_height, error)) return false;
    if (!ReadIntField(grid, "max_label_length", &parsed.grid.max_label_length, error)) {
      return false;
    }
    if (!ReadBoolField(grid, "include_labels", &parsed.grid.include_labels, error)) return false;
  }

  if (root.contains("execution")) {
    if (!ReadStringField(root.at("execution"), "mode", &parsed.execution_mode, error)) {
      return false;
    }
    parsed.execution_mode = xyz::ToLower(parsed.execution_mode);
  }

  if (!ValidateSweepConfig(parsed, error)) {
    return false;
  }
  *config = std::move(parsed);
  return true;
}

}  // namespace

bool LoadSweepConfigFromString(const std::string& content,
                               SweepConfig* config,
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
  return ParseSweepConfigJson(root, config, error);
}

bool LoadSweepConfigFromFile(const std::filesystem::path& path,
                             SweepConfig* config,
                             std::string* error) {
  std::string content;
  if (!ReadTextFile(path, &content, error)) {
    return false;
  }
  return LoadSweepConfigFromString(content, config, error);
}

bool SaveSweepConfigToFile(const std::filesystem::path& path,
                           const SweepConfig& config,
                           std::string* error) {
  const std::string payload = SerializeSweepConfig(config, 2);
  return WriteTextFile(path, payload, error);
}

std::string SerializeSweepConfig(const SweepConfig& config, int indent) {
  json root = SweepConfigToJson(config);
  return root.dump(indent);
}

bool ValidateSweepConfig(const SweepConfig& config, std::string* error) {
  if (config.schema_version != 1) {
    if (error) {
      *error = "unsupported schema_version";
    }
    return false;
  }
  const std::pair<const char*, const SweepAxisConfig*> axes[] = {
      {"x", &config.x}, {"y", &config.y}, {"z", &config.z}};
  for (const auto& axis : axes) {
    const std::string token = xyz::ToLower(xyz::Trim(axis.second->type));
    if (!token.empty() && !IsAxisTypeToken(token)) {
      if (error) {
        *error = std::string("unknown axis type '") + axis.second->type + "' for axes." +
                 axis.first;
      }
      return false;
    }
  }
  if (ParseAxisType(config.x.type) == AxisType::None &&
      ParseAxisType(config.y.type) == AxisType::None) {
    if (error) {
      *error = "at least one axis (X or Y) must be configured";
    }
    return false;
  }
  if (!CheckRange(config.grid.font_size, 8, 72, "font_size", error)) return false;
  if (!CheckRange(config.grid.grid_gap, 0, 50, "grid_gap", error)) return false;
  if (!CheckRange(config.grid.label_height, 0, 100, "label_height", error)) return false;
  if (!CheckRange(config.grid.max_label_length, 10, 100, "max_label_length", error)) {
    return false;
  }
  if (!IsExecutionModeToken(config.execution_mode)) {
    if (error) {
      *error = "execution.mode must be step or queue";
    }
    return false;
  }
  return true;
}

GridControllerRequest BuildControllerRequest(const SweepConfig& config) {
  GridControllerRequest request;
  request.x = {config.x.type, config.x.values, config.x.label_prefix};
  request.y = {config.y.type, config.y.values, config.y.label_prefix};
  request.z = {config.z.type, config.z.values, config.z.label_prefix};
  request.include_param_name = config.include_param_name;
  request.value_only_labels = config.value_only_labels;
  request.batch_id = config.batch_id;
  return request;
}
