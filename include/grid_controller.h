#ifndef GRID_CONTROLLER_H
#define GRID_CONTROLLER_H

#include <cstdint>
#include <string>

#include "axis_type.h"
#include "grid_config.h"

class ExecutionManager;
class LogService;

// Raw axis input as typed by the user.
struct AxisInput {
  std::string type = "none";
  std::string values;
  std::string label_prefix;
};

struct GridControllerRequest {
  AxisInput x;
  AxisInput y;
  AxisInput z;
  bool include_param_name = true;
  bool value_only_labels = false;
  std::string batch_id;  // empty: a fresh id is generated
};

// Current value of one axis in every representation a downstream input may
// want. int_value/float_value are zero for string axes. Seeds above the int64
// range saturate int_value; uint_value carries them exactly.
struct AxisOutput {
  std::string string_value;
  int64_t int_value = 0;
  uint64_t uint_value = 0;
  double float_value = 0.0;
  OutputType type = OutputType::String;
  int index = 0;
};

struct ControllerResult {
  bool ok = false;
  std::string error;
  GridConfiguration config;
  AxisOutput x;
  AxisOutput y;
  AxisOutput z;
  std::string batch_id;
};

// Parse the axes into a validated grid configuration. Fails when neither X nor
// Y is configured, when an axis type is unknown, or when a configured axis
// yields no values.
bool BuildGridConfiguration(const GridControllerRequest& request,
                            GridConfiguration* config,
                            std::string* error,
                            LogService* log = nullptr);

// One controller tick: build the configuration and look up the combination the
// batch is currently on.
ControllerResult ConfigureGrid(const GridControllerRequest& request,
                               ExecutionManager* manager,
                               LogService* log = nullptr);

AxisOutput MakeAxisOutput(const AxisValue& value, AxisType type, int index);

#endif  // GRID_CONTROLLER_H
