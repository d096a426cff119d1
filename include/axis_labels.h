#ifndef AXIS_LABELS_H
#define AXIS_LABELS_H

#include <string>
#include <vector>

#include "axis_type.h"
#include "grid_config.h"

// One label per value: model/vae/lora reduced to their file stem, prompts cut
// at 30 characters, everything else in its plain string form.
std::vector<std::string> GenerateAxisLabels(const std::vector<AxisValue>& values,
                                            AxisType type,
                                            const std::string& prefix = "");

// Label policy of the controller. value_only wins over include_param_name; an
// explicit prefix wins over the parameter name.
std::vector<std::string> BuildAxisLabels(const std::vector<AxisValue>& values,
                                         AxisType type,
                                         const std::string& prefix,
                                         bool include_param_name,
                                         bool value_only);

GridDimensions CalculateGridDimensions(int x_count, int y_count, int z_count = 1);

// Short random batch identifier (8 chars, [a-z0-9]).
std::string CreateUniqueId(size_t length = 8);

#endif  // AXIS_LABELS_H
