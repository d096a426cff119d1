#include "sweep_service.h"

#include <map>
#include <optional>

#include "axis_labels.h"
#include "execution_state.h"
#include "grid_controller.h"
#include "log_service.h"
#include "progress_tracker.h"
#include "queue_manager.h"

namespace {

constexpr const char* kLogCategory = "controller";

AxisValue ValueAt(const AxisSpec& axis, int index) {
  if (index < 0 || index >= static_cast<int>(axis.values.size())) {
    return std::string();
  }
  return axis.values[static_cast<size_t>(index)];
}

std::map<std::string, std::string> CellLabels(const GridConfiguration& grid,
                                              const CellRequest& cell) {
  std::map<std::string, std::string> labels;
  const auto add = [&labels](const char* name, const AxisSpec& axis, int index) {
    if (index >= 0 && index < static_cast<int>(axis.labels.size())) {
      labels[name] = axis.labels[static_cast<size_t>(index)];
    }
  };
  add("x", grid.axes.x, cell.x_index);
  add("y", grid.axes.y, cell.y_index);
  add("z", grid.axes.z, cell.z_index);
  return labels;
}

// Feeds one rendered cell to the compositor. Returns false on a compositor
// error; sets *done once the pages were emitted.
bool DeliverCell(const SweepRequest& request,
                 const GridConfiguration& grid,
                 const CellRequest& cell,
                 GridImageCompositor* compositor,
                 SweepResponse* response,
                 bool* done) {
  const Image image = request.renderer
                          ? request.renderer(cell)
                          : RenderSyntheticCell(cell, request.cell_width, request.cell_height);
  const CombineResult combined = compositor->CombineImages(image, grid, request.config.grid);
  if (!combined.ok) {
    response->error = combined.error;
    if (request.progress) {
      request.progress->ErrorGrid(grid.batch_id, combined.error);
    }
    return false;
  }
  if (request.progress) {
    request.progress->UpdateProgress(grid.batch_id, combined.received, CellLabels(grid, cell));
  }
  if (combined.complete) {
    response->pages = combined.pages;
    response->info = combined.info;
    *done = true;
  }
  return true;
}

SweepResponse RunStepMode(const SweepRequest& request, const std::string& batch_id,
                          LogService* log) {
  SweepResponse response;
  response.batch_id = batch_id;
  GridControllerRequest controller = BuildControllerRequest(request.config);
  controller.batch_id = batch_id;

  ExecutionManager manager(nullptr, log);
  GridImageCompositor compositor(nullptr, log);
  bool done = false;
  int total = 0;
  while (!done) {
    const ControllerResult tick = ConfigureGrid(controller, &manager, log);
    if (!tick.ok) {
      response.error = tick.error;
      break;
    }
    if (response.ticks == 0) {
      response.grid = tick.config;
      total = tick.config.dimensions.total_images;
      if (request.progress) {
        request.progress->StartGrid(batch_id, total);
      }
    }
    GridExecutionState state;
    manager.GetState(batch_id, &state);

    CellRequest cell;
    cell.batch_id = batch_id;
    cell.iteration = state.current_iteration();
    cell.total_iterations = total;
    cell.x_value = ValueAt(tick.config.axes.x, tick.x.index);
    cell.y_value = ValueAt(tick.config.axes.y, tick.y.index);
    cell.z_value = ValueAt(tick.config.axes.z, tick.z.index);
    cell.x_index = tick.x.index;
    cell.y_index = tick.y.index;
    cell.z_index = tick.z.index;
    ++response.ticks;

    if (!DeliverCell(request, tick.config, cell, &compositor, &response, &done)) {
      break;
    }
    if (!manager.AdvanceBatch(batch_id) && !done) {
      response.error = "sweep finished before the grid received all images";
      break;
    }
  }
  manager.CleanupBatch(batch_id);
  compositor.DiscardBatch(batch_id);
  response.ok = done && response.error.empty();
  return response;
}

SweepResponse RunQueueMode(const SweepRequest& request, const std::string& batch_id,
                           LogService* log) {
  SweepResponse response;
  response.batch_id = batch_id;
  GridControllerRequest controller = BuildControllerRequest(request.config);
  controller.batch_id = batch_id;
  if (!BuildGridConfiguration(controller, &response.grid, &response.error, log)) {
    return response;
  }

  GridQueueManager queue(nullptr, log);
  GridImageCompositor compositor(nullptr, log);
  queue.PrepareBatchExecutions(batch_id, response.grid, batch_id, request.payload);
  if (request.progress) {
    request.progress->StartGrid(batch_id, response.grid.dimensions.total_images);
  }

  bool done = false;
  while (!done) {
    const std::optional<QueuedExecution> next = queue.GetNextExecution(batch_id);
    if (!next) {
      response.error = "queue drained before the grid received all images";
      break;
    }
    CellRequest cell;
    cell.batch_id = batch_id;
    cell.iteration = next->iteration;
    cell.total_iterations = next->total_iterations;
    cell.x_value = next->x_value;
    cell.y_value = next->y_value;
    cell.z_value = next->z_value;
    cell.x_index = next->x_index;
    cell.y_index = next->y_index;
    cell.z_index = next->z_index;
    ++response.ticks;

    if (!DeliverCell(request, response.grid, cell, &compositor, &response, &done)) {
      break;
    }
    queue.MarkIterationComplete(batch_id, next->iteration);
  }
  if (done && !queue.IsBatchComplete(batch_id) && log) {
    log->Warning(kLogCategory, "batch " + batch_id + " composed with iterations still queued");
  }
  queue.CleanupBatch(batch_id);
  compositor.DiscardBatch(batch_id);
  response.ok = done && response.error.empty();
  return response;
}

}  // namespace

Image RenderSyntheticCell(const CellRequest& cell, int width, int height) {
  const float t = cell.total_iterations > 1
                      ? static_cast<float>(cell.iteration) /
                            static_cast<float>(cell.total_iterations - 1)
                      : 0.0f;
  return MakeSolidImage(width, height, ColorRamp(t));
}

SweepResponse ExecuteSweep(const SweepRequest& request, LogService* log) {
  std::string error;
  if (!ValidateSweepConfig(request.config, &error)) {
    SweepResponse response;
    response.error = error;
    return response;
  }
  if (request.cell_width <= 0 || request.cell_height <= 0) {
    SweepResponse response;
    response.error = "cell size must be positive";
    return response;
  }
  const std::string batch_id =
      request.config.batch_id.empty() ? CreateUniqueId() : request.config.batch_id;
  if (log) {
    log->Info(kLogCategory, "running batch " + batch_id + " in " +
                                request.config.execution_mode + " mode");
  }
  SweepResponse response = request.config.execution_mode == "queue"
                               ? RunQueueMode(request, batch_id, log)
                               : RunStepMode(request, batch_id, log);
  if (!response.ok && log) {
    log->Error(kLogCategory, "batch " + batch_id + " failed: " + response.error);
  }
  return response;
}
