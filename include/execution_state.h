#ifndef EXECUTION_STATE_H
#define EXECUTION_STATE_H

#include <memory>
#include <string>
#include <vector>

#include "axis_type.h"
#include "batch_store.h"

class LogService;

struct ExecutionIndices {
  int x = 0;
  int y = 0;
  int z = 0;
};

// Position of one batch inside its X*Y*Z sweep. X varies fastest, Z slowest:
// while in progress, current_iteration == z*(nx*ny) + y*nx + x.
class GridExecutionState {
 public:
  GridExecutionState() = default;
  GridExecutionState(std::string batch_id, int x_count, int y_count, int z_count);

  // Step to the next combination. Returns false once the sweep is exhausted;
  // the indices then stay on the last valid combination.
  bool Advance();

  ExecutionIndices GetIndices() const { return {x_index_, y_index_, z_index_}; }
  bool IsComplete() const { return current_iteration_ >= total_iterations_; }

  const std::string& batch_id() const { return batch_id_; }
  int total_iterations() const { return total_iterations_; }
  int current_iteration() const { return current_iteration_; }
  int x_count() const { return x_count_; }
  int y_count() const { return y_count_; }
  int z_count() const { return z_count_; }

 private:
  std::string batch_id_;
  int total_iterations_ = 0;
  int current_iteration_ = 0;
  int x_index_ = 0;
  int y_index_ = 0;
  int z_index_ = 0;
  int x_count_ = 1;
  int y_count_ = 1;
  int z_count_ = 1;
};

// Pure form of GridExecutionState::Advance().
GridExecutionState AdvanceState(const GridExecutionState& state);

struct CurrentValues {
  AxisValue x_value = std::string();
  AxisValue y_value = std::string();
  AxisValue z_value = std::string();
  int x_index = 0;
  int y_index = 0;
  int z_index = 0;
};

using ExecutionStateStore = BatchStore<GridExecutionState>;

// Single-step driver: the controller asks for the current combination on each
// tick and advances once the downstream image for it has been produced.
// Callers must CleanupBatch() finished batches; the store is never pruned here.
class ExecutionManager {
 public:
  explicit ExecutionManager(std::shared_ptr<ExecutionStateStore> store = nullptr,
                            LogService* log = nullptr);

  // Counts are max(1, len(values)) so an empty axis never zeroes the product.
  GridExecutionState InitializeBatch(const std::string& batch_id,
                                     const std::vector<AxisValue>& x_values,
                                     const std::vector<AxisValue>& y_values,
                                     const std::vector<AxisValue>& z_values);

  // Initializes the batch on first use. An index outside the supplied list
  // yields an empty string for that axis.
  CurrentValues GetCurrentValues(const std::string& batch_id,
                                 const std::vector<AxisValue>& x_values,
                                 const std::vector<AxisValue>& y_values,
                                 const std::vector<AxisValue>& z_values);

  bool ShouldContinue(const std::string& batch_id) const;
  bool AdvanceBatch(const std::string& batch_id);
  void CleanupBatch(const std::string& batch_id);

  bool GetState(const std::string& batch_id, GridExecutionState* out) const;
  size_t ActiveBatchCount() const;

 private:
  std::shared_ptr<ExecutionStateStore> store_;
  LogService* log_ = nullptr;
};

#endif  // EXECUTION_STATE_H
