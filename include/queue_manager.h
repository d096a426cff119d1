#ifndef QUEUE_MANAGER_H
#define QUEUE_MANAGER_H

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "axis_type.h"
#include "batch_store.h"
#include "grid_config.h"

class LogService;

// One combination of an eagerly queued sweep.
struct QueuedExecution {
  std::string execution_id;
  std::string batch_id;
  int iteration = 0;
  int total_iterations = 0;
  AxisValue x_value = std::string();
  AxisValue y_value = std::string();
  AxisValue z_value = std::string();
  int x_index = 0;
  int y_index = 0;
  int z_index = 0;
  nlohmann::json payload;  // owned copy of the downstream work description
};

nlohmann::json QueuedExecutionToJson(const QueuedExecution& execution);

struct QueuedBatch {
  std::string context_id;
  int total_iterations = 0;
  std::vector<QueuedExecution> executions;  // iteration order
  std::set<int> completed;
};

using QueueStore = BatchStore<QueuedBatch>;

// Precomputes every combination of a batch up front, for hosts that queue the
// whole sweep at once instead of stepping it one tick at a time. Iterations are
// numbered exactly like GridExecutionState (X fastest, Z slowest).
class GridQueueManager {
 public:
  explicit GridQueueManager(std::shared_ptr<QueueStore> store = nullptr,
                            LogService* log = nullptr);

  // Replaces any earlier preparation of the same batch. When payload is an
  // object, each copy gains an "xyz_grid" entry describing its combination.
  // Batches larger than kMaxGridImages are refused and yield no executions.
  std::vector<QueuedExecution> PrepareBatchExecutions(const std::string& batch_id,
                                                      const GridConfiguration& grid_config,
                                                      const std::string& context_id,
                                                      const nlohmann::json& payload);

  std::optional<QueuedExecution> GetNextExecution(const std::string& batch_id) const;
  std::vector<QueuedExecution> PendingExecutions(const std::string& batch_id) const;

  // Iterations outside [0, total_iterations) are ignored with a warning.
  void MarkIterationComplete(const std::string& batch_id, int iteration);

  // Unknown batches count as complete.
  bool IsBatchComplete(const std::string& batch_id) const;
  int CompletedCount(const std::string& batch_id) const;

  void CleanupBatch(const std::string& batch_id);
  size_t ActiveBatchCount() const;

 private:
  std::shared_ptr<QueueStore> store_;
  LogService* log_ = nullptr;
};

#endif  // QUEUE_MANAGER_H
