#include "queue_manager.h"

#include <cstdint>
#include <utility>

#include "axis_labels.h"
#include "log_service.h"

namespace {

using json = nlohmann::json;

constexpr const char* kLogCategory = "queue";

// Axes without values still contribute one "" slot.
std::vector<AxisValue> SlotsOf(const AxisSpec& axis) {
  if (axis.values.empty()) {
    return {AxisValue(std::string())};
  }
  return axis.values;
}

json CombinationJson(const QueuedExecution& execution, const std::string& context_id) {
  json cell;
  cell["context_id"] = context_id;
  cell["iteration"] = execution.iteration;
  cell["total_iterations"] = execution.total_iterations;
  cell["indices"] = {{"x", execution.x_index}, {"y", execution.y_index}, {"z", execution.z_index}};
  cell["values"] = {{"x", AxisValueToJson(execution.x_value)},
                    {"y", AxisValueToJson(execution.y_value)},
                    {"z", AxisValueToJson(execution.z_value)}};
  return cell;
}

}  // namespace

json QueuedExecutionToJson(const QueuedExecution& execution) {
  json out;
  out["execution_id"] = execution.execution_id;
  out["batch_id"] = execution.batch_id;
  out["iteration"] = execution.iteration;
  out["total_iterations"] = execution.total_iterations;
  out["indices"] = {{"x", execution.x_index}, {"y", execution.y_index}, {"z", execution.z_index}};
  out["values"] = {{"x", AxisValueToJson(execution.x_value)},
                   {"y", AxisValueToJson(execution.y_value)},
                   {"z", AxisValueToJson(execution.z_value)}};
  return out;
}

GridQueueManager::GridQueueManager(std::shared_ptr<QueueStore> store, LogService* log)
    : store_(store ? std::move(store) : std::make_shared<InMemoryBatchStore<QueuedBatch>>()),
      log_(log) {}

std::vector<QueuedExecution> GridQueueManager::PrepareBatchExecutions(
    const std::string& batch_id,
    const GridConfiguration& grid_config,
    const std::string& context_id,
    const json& payload) {
  const std::vector<AxisValue> x_values = SlotsOf(grid_config.axes.x);
  const std::vector<AxisValue> y_values = SlotsOf(grid_config.axes.y);
  const std::vector<AxisValue> z_values = SlotsOf(grid_config.axes.z);
  const uint64_t combinations = static_cast<uint64_t>(x_values.size()) * y_values.size() *
                                z_values.size();
  if (combinations > static_cast<uint64_t>(kMaxGridImages)) {
    if (log_) {
      log_->Error(kLogCategory, "batch " + batch_id + " has " + std::to_string(combinations) +
                                    " combinations, more than the limit of " +
                                    std::to_string(kMaxGridImages));
    }
    return {};
  }
  const int total = static_cast<int>(combinations);

  QueuedBatch batch;
  batch.context_id = context_id;
  batch.total_iterations = total;
  batch.executions.reserve(static_cast<size_t>(total));

  int iteration = 0;
  for (size_t z = 0; z < z_values.size(); ++z) {
    for (size_t y = 0; y < y_values.size(); ++y) {
      for (size_t x = 0; x < x_values.size(); ++x) {
        QueuedExecution execution;
        execution.execution_id = batch_id + "-" + CreateUniqueId(12);
        execution.batch_id = batch_id;
        execution.iteration = iteration;
        execution.total_iterations = total;
        execution.x_value = x_values[x];
        execution.y_value = y_values[y];
        execution.z_value = z_values[z];
        execution.x_index = static_cast<int>(x);
        execution.y_index = static_cast<int>(y);
        execution.z_index = static_cast<int>(z);
        execution.payload = payload;
        if (execution.payload.is_object()) {
          execution.payload["xyz_grid"] = CombinationJson(execution, context_id);
        }
        batch.executions.push_back(std::move(execution));
        ++iteration;
      }
    }
  }

  std::vector<QueuedExecution> executions = batch.executions;
  store_->Put(batch_id, std::move(batch));
  if (log_) {
    log_->Info(kLogCategory, "queued " + std::to_string(total) + " executions for batch " +
                                 batch_id);
  }
  return executions;
}

std::optional<QueuedExecution> GridQueueManager::GetNextExecution(
    const std::string& batch_id) const {
  std::optional<QueuedExecution> next;
  store_->Visit(batch_id, [&next](const QueuedBatch& batch) {
    for (const auto& execution : batch.executions) {
      if (batch.completed.count(execution.iteration) == 0) {
        next = execution;
        return;
      }
    }
  });
  return next;
}

std::vector<QueuedExecution> GridQueueManager::PendingExecutions(
    const std::string& batch_id) const {
  std::vector<QueuedExecution> pending;
  store_->Visit(batch_id, [&pending](const QueuedBatch& batch) {
    for (const auto& execution : batch.executions) {
      if (batch.completed.count(execution.iteration) == 0) {
        pending.push_back(execution);
      }
    }
  });
  return pending;
}

void GridQueueManager::MarkIterationComplete(const std::string& batch_id, int iteration) {
  bool inserted = false;
  bool in_range = true;
  const bool found = store_->Modify(batch_id, [&](QueuedBatch* batch) {
    in_range = iteration >= 0 && iteration < batch->total_iterations;
    if (in_range) {
      inserted = batch->completed.insert(iteration).second;
    }
  });
  if (!found && log_) {
    log_->Warning(kLogCategory, "completion of iteration " + std::to_string(iteration) +
                                    " reported for unknown batch " + batch_id);
  } else if (!in_range && log_) {
    log_->Warning(kLogCategory, "ignoring out-of-range iteration " + std::to_string(iteration) +
                                    " for batch " + batch_id);
  } else if (inserted && log_) {
    log_->Info(kLogCategory, "batch " + batch_id + " iteration " + std::to_string(iteration) +
                                 " complete");
  }
}

bool GridQueueManager::IsBatchComplete(const std::string& batch_id) const {
  bool complete = true;
  store_->Visit(batch_id, [&complete](const QueuedBatch& batch) {
    complete = static_cast<int>(batch.completed.size()) >= batch.total_iterations;
  });
  return complete;
}

int GridQueueManager::CompletedCount(const std::string& batch_id) const {
  int count = 0;
  store_->Visit(batch_id, [&count](const QueuedBatch& batch) {
    count = static_cast<int>(batch.completed.size());
  });
  return count;
}

void GridQueueManager::CleanupBatch(const std::string& batch_id) {
  if (store_->Erase(batch_id) && log_) {
    log_->Info(kLogCategory, "cleaned up batch " + batch_id);
  }
}

size_t GridQueueManager::ActiveBatchCount() const {
  return store_->Size();
}
