// Drives a whole sweep in-process: the same tick sequence a host scheduler
// would produce, used by the CLI simulator, the self-test and the tests.
#ifndef SWEEP_SERVICE_H
#define SWEEP_SERVICE_H

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "grid_compositor.h"
#include "grid_config.h"
#include "image.h"
#include "sweep_config.h"

class LogService;
class ProgressTracker;

// What the downstream pipeline is asked to render for one combination.
struct CellRequest {
  std::string batch_id;
  int iteration = 0;
  int total_iterations = 0;
  AxisValue x_value = std::string();
  AxisValue y_value = std::string();
  AxisValue z_value = std::string();
  int x_index = 0;
  int y_index = 0;
  int z_index = 0;
};

using CellRenderer = std::function<Image(const CellRequest& cell)>;

// Solid colour from a ramp over the iteration number.
Image RenderSyntheticCell(const CellRequest& cell, int width, int height);

struct SweepRequest {
  SweepConfig config;
  int cell_width = 64;
  int cell_height = 64;
  CellRenderer renderer;           // defaults to RenderSyntheticCell
  nlohmann::json payload = nlohmann::json::object();  // queue mode only
  ProgressTracker* progress = nullptr;
};

struct SweepResponse {
  bool ok = false;
  std::string error;
  std::string batch_id;
  GridConfiguration grid;
  std::vector<Image> pages;
  std::string info;
  int ticks = 0;
};

SweepResponse ExecuteSweep(const SweepRequest& request, LogService* log = nullptr);

#endif  // SWEEP_SERVICE_H
