#include "axis_labels.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <random>

#include "string_utils.h"

namespace {
constexpr size_t kPromptLabelLength = 30;
}

std::vector<std::string> GenerateAxisLabels(const std::vector<AxisValue>& values,
                                            AxisType type,
                                            const std::string& prefix) {
  std::vector<std::string> labels;
  labels.reserve(values.size());
  for (const auto& value : values) {
    const std::string text = AxisValueToString(value);
    std::string label;
    switch (type) {
      case AxisType::Model:
      case AxisType::Vae:
      case AxisType::Lora:
        label = xyz::PathStem(text);
        break;
      case AxisType::Prompt:
        label = text.size() > kPromptLabelLength ? text.substr(0, kPromptLabelLength) + "..."
                                                 : text;
        break;
      default:
        label = text;
        break;
    }
    labels.push_back(prefix + label);
  }
  return labels;
}

std::vector<std::string> BuildAxisLabels(const std::vector<AxisValue>& values,
                                         AxisType type,
                                         const std::string& prefix,
                                         bool include_param_name,
                                         bool value_only) {
  if (values.empty() || type == AxisType::None) {
    return {};
  }
  if (value_only) {
    return GenerateAxisLabels(values, type, "");
  }
  if (include_param_name && prefix.empty()) {
    return GenerateAxisLabels(values, type, AxisTypeDisplayName(type) + ": ");
  }
  return GenerateAxisLabels(values, type, prefix);
}

GridDimensions CalculateGridDimensions(int x_count, int y_count, int z_count) {
  GridDimensions dims;
  const int64_t total = static_cast<int64_t>(x_count) * y_count * z_count;
  dims.total_images =
      static_cast<int>(std::min<int64_t>(total, std::numeric_limits<int>::max()));
  dims.grids_count = z_count > 0 ? z_count : 1;
  dims.cols = x_count;
  dims.rows = y_count;
  return dims;
}

std::string CreateUniqueId(size_t length) {
  static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(kAlphabet[dist(gen)]);
  }
  return out;
}
