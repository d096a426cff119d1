#include "execution_state.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

#include "log_service.h"

namespace {

constexpr const char* kLogCategory = "execution";

// Saturates at INT_MAX instead of overflowing.
int IterationCount(int x_count, int y_count, int z_count) {
  const int64_t total = static_cast<int64_t>(std::max(0, x_count)) * std::max(0, y_count) *
                        std::max(0, z_count);
  return static_cast<int>(std::min<int64_t>(total, std::numeric_limits<int>::max()));
}

int CountOf(const std::vector<AxisValue>& values) {
  return std::max(1, static_cast<int>(values.size()));
}

AxisValue ValueAt(const std::vector<AxisValue>& values, int index, bool* out_of_range) {
  if (index >= 0 && index < static_cast<int>(values.size())) {
    return values[static_cast<size_t>(index)];
  }
  // An empty list is the expected shape of an unconfigured axis.
  if (!values.empty() && out_of_range) {
    *out_of_range = true;
  }
  return std::string();
}

}  // namespace

GridExecutionState::GridExecutionState(std::string batch_id, int x_count, int y_count,
                                       int z_count)
    : batch_id_(std::move(batch_id)),
      total_iterations_(IterationCount(x_count, y_count, z_count)),
      x_count_(x_count),
      y_count_(y_count),
      z_count_(z_count) {}

bool GridExecutionState::Advance() {
  if (IsComplete()) {
    return false;
  }
  ++current_iteration_;
  if (current_iteration_ >= total_iterations_) {
    return false;
  }
  ++x_index_;
  if (x_index_ >= x_count_) {
    x_index_ = 0;
    ++y_index_;
    if (y_index_ >= y_count_) {
      y_index_ = 0;
      ++z_index_;
    }
  }
  return true;
}

GridExecutionState AdvanceState(const GridExecutionState& state) {
  GridExecutionState next = state;
  next.Advance();
  return next;
}

ExecutionManager::ExecutionManager(std::shared_ptr<ExecutionStateStore> store, LogService* log)
    : store_(store ? std::move(store)
                   : std::make_shared<InMemoryBatchStore<GridExecutionState>>()),
      log_(log) {}

GridExecutionState ExecutionManager::InitializeBatch(const std::string& batch_id,
                                                     const std::vector<AxisValue>& x_values,
                                                     const std::vector<AxisValue>& y_values,
                                                     const std::vector<AxisValue>& z_values) {
  GridExecutionState state(batch_id, CountOf(x_values), CountOf(y_values), CountOf(z_values));
  store_->Put(batch_id, state);
  if (log_) {
    log_->Info(kLogCategory, "initialized batch " + batch_id + " with " +
                                 std::to_string(state.total_iterations()) + " iterations");
  }
  return state;
}

CurrentValues ExecutionManager::GetCurrentValues(const std::string& batch_id,
                                                 const std::vector<AxisValue>& x_values,
                                                 const std::vector<AxisValue>& y_values,
                                                 const std::vector<AxisValue>& z_values) {
  GridExecutionState state;
  if (!store_->Find(batch_id, &state)) {
    state = InitializeBatch(batch_id, x_values, y_values, z_values);
  }

  const ExecutionIndices indices = state.GetIndices();
  bool out_of_range = false;
  CurrentValues current;
  current.x_value = ValueAt(x_values, indices.x, &out_of_range);
  current.y_value = ValueAt(y_values, indices.y, &out_of_range);
  current.z_value = ValueAt(z_values, indices.z, &out_of_range);
  current.x_index = indices.x;
  current.y_index = indices.y;
  current.z_index = indices.z;

  if (out_of_range && log_) {
    log_->Warning(kLogCategory, "batch " + batch_id + " index (" + std::to_string(indices.x) +
                                    "," + std::to_string(indices.y) + "," +
                                    std::to_string(indices.z) +
                                    ") is outside the supplied values");
  }
  return current;
}

bool ExecutionManager::ShouldContinue(const std::string& batch_id) const {
  GridExecutionState state;
  if (!store_->Find(batch_id, &state)) {
    return false;
  }
  return !state.IsComplete();
}

bool ExecutionManager::AdvanceBatch(const std::string& batch_id) {
  bool advanced = false;
  int iteration = 0;
  int total = 0;
  const bool found = store_->Modify(batch_id, [&](GridExecutionState* state) {
    advanced = state->Advance();
    iteration = state->current_iteration();
    total = state->total_iterations();
  });
  if (!found) {
    return false;
  }
  if (log_ && !advanced) {
    log_->Info(kLogCategory, "batch " + batch_id + " complete after " + std::to_string(total) +
                                 " iterations");
  } else if (log_) {
    log_->Info(kLogCategory, "batch " + batch_id + " iteration " +
                                 std::to_string(iteration + 1) + "/" + std::to_string(total));
  }
  return advanced;
}

void ExecutionManager::CleanupBatch(const std::string& batch_id) {
  if (store_->Erase(batch_id) && log_) {
    log_->Info(kLogCategory, "cleaned up batch " + batch_id);
  }
}

bool ExecutionManager::GetState(const std::string& batch_id, GridExecutionState* out) const {
  return store_->Find(batch_id, out);
}

size_t ExecutionManager::ActiveBatchCount() const {
  return store_->Size();
}
