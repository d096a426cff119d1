#ifndef GRID_CONFIG_H
#define GRID_CONFIG_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "axis_type.h"

struct AxisSpec {
  AxisType type = AxisType::None;
  std::vector<AxisValue> values;
  std::vector<std::string> labels;  // empty, or one per value
  std::string label_prefix;

  // An axis without values still occupies one slot of the grid.
  int EffectiveCount() const;
  bool IsConfigured() const { return type != AxisType::None; }
};

// Upper bound on cols * rows * grids_count for one batch.
constexpr int kMaxGridImages = 100000;

struct GridDimensions {
  int total_images = 1;
  int cols = 1;
  int rows = 1;
  int grids_count = 1;
};

struct GridAxes {
  AxisSpec x;
  AxisSpec y;
  AxisSpec z;
};

// One sweep configuration. Immutable for the lifetime of its batch.
struct GridConfiguration {
  std::string batch_id;
  GridAxes axes;
  GridDimensions dimensions;
};

nlohmann::json AxisValueToJson(const AxisValue& value);
// Strings, integers and floats map onto the matching alternative; booleans
// and structured values are rejected.
bool AxisValueFromJson(const nlohmann::json& j, AxisValue* out, std::string* error);

nlohmann::json GridConfigurationToJson(const GridConfiguration& config);
bool GridConfigurationFromJson(const nlohmann::json& j,
                               GridConfiguration* config,
                               std::string* error);

std::string SerializeGridConfiguration(const GridConfiguration& config, int indent = 2);
bool LoadGridConfigurationFromString(const std::string& content,
                                     GridConfiguration* config,
                                     std::string* error);

// Labels match values, dimensions agree with the axes, batch id present.
bool ValidateGridConfiguration(const GridConfiguration& config, std::string* error);

#endif  // GRID_CONFIG_H
