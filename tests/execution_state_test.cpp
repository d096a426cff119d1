#include "execution_state.h"
#include "log_service.h"

#include <iostream>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace {
bool CheckSweep(int nx, int ny, int nz) {
  GridExecutionState state("sweep", nx, ny, nz);
  const int total = nx * ny * nz;
  if (state.total_iterations() != total) {
    std::cerr << "total mismatch for " << nx << "x" << ny << "x" << nz << "\n";
    return false;
  }
  std::set<std::tuple<int, int, int>> seen;
  for (int i = 0; i < total; ++i) {
    if (state.IsComplete()) {
      std::cerr << "complete too early at " << i << "\n";
      return false;
    }
    const ExecutionIndices idx = state.GetIndices();
    if (state.current_iteration() != idx.z * nx * ny + idx.y * nx + idx.x) {
      std::cerr << "iteration/index invariant broken at " << i << "\n";
      return false;
    }
    if (state.current_iteration() != i) {
      std::cerr << "iteration counter drifted at " << i << "\n";
      return false;
    }
    seen.insert(std::make_tuple(idx.x, idx.y, idx.z));
    const bool advanced = state.Advance();
    if (advanced != (i + 1 < total)) {
      std::cerr << "Advance() returned " << advanced << " at " << i << "\n";
      return false;
    }
  }
  if (!state.IsComplete()) {
    std::cerr << "not complete after " << total << " advances\n";
    return false;
  }
  if (static_cast<int>(seen.size()) != total) {
    std::cerr << "visited " << seen.size() << " distinct combinations of " << total << "\n";
    return false;
  }
  // Frozen once complete.
  const ExecutionIndices last = state.GetIndices();
  if (state.Advance()) {
    std::cerr << "Advance() succeeded after completion\n";
    return false;
  }
  const ExecutionIndices after = state.GetIndices();
  if (after.x != last.x || after.y != last.y || after.z != last.z ||
      last.x != nx - 1 || last.y != ny - 1 || last.z != nz - 1) {
    std::cerr << "indices moved after completion\n";
    return false;
  }
  return true;
}
}  // namespace

int main() {
  const int shapes[][3] = {{1, 1, 1}, {3, 1, 1}, {1, 4, 1}, {2, 3, 1}, {3, 2, 2}, {2, 2, 3}};
  for (const auto& shape : shapes) {
    if (!CheckSweep(shape[0], shape[1], shape[2])) {
      std::cerr << "sweep failed for " << shape[0] << "x" << shape[1] << "x" << shape[2] << "\n";
      return 1;
    }
  }

  {
    GridExecutionState state("x-fastest", 2, 2, 1);
    state.Advance();
    const ExecutionIndices idx = state.GetIndices();
    if (idx.x != 1 || idx.y != 0) {
      std::cerr << "X must vary fastest\n";
      return 1;
    }
    const GridExecutionState next = AdvanceState(state);
    if (next.current_iteration() != 2 || state.current_iteration() != 1) {
      std::cerr << "AdvanceState must not modify its input\n";
      return 1;
    }
  }

  LogService log;
  auto store = std::make_shared<InMemoryBatchStore<GridExecutionState>>();
  ExecutionManager manager(store, &log);
  const std::vector<AxisValue> xs = {std::string("euler"), std::string("ddim")};
  const std::vector<AxisValue> ys = {5.0, 7.5};
  const std::vector<AxisValue> zs = {std::string()};

  if (manager.ShouldContinue("batch")) {
    std::cerr << "unknown batch must not continue\n";
    return 1;
  }
  if (manager.AdvanceBatch("batch")) {
    std::cerr << "advancing an unknown batch must fail\n";
    return 1;
  }

  std::vector<std::string> order;
  for (int tick = 0; tick < 4; ++tick) {
    const CurrentValues current = manager.GetCurrentValues("batch", xs, ys, zs);
    order.push_back(AxisValueToString(current.x_value) + "/" +
                    AxisValueToString(current.y_value));
    if (!manager.ShouldContinue("batch")) {
      std::cerr << "batch stopped early at tick " << tick << "\n";
      return 1;
    }
    const bool advanced = manager.AdvanceBatch("batch");
    if (advanced != (tick < 3)) {
      std::cerr << "AdvanceBatch returned " << advanced << " at tick " << tick << "\n";
      return 1;
    }
  }
  const std::vector<std::string> expected = {"euler/5.0", "ddim/5.0", "euler/7.5", "ddim/7.5"};
  if (order != expected) {
    std::cerr << "unexpected combination order\n";
    return 1;
  }
  if (manager.ShouldContinue("batch")) {
    std::cerr << "completed batch must not continue\n";
    return 1;
  }
  if (manager.ActiveBatchCount() != 1 || store->Size() != 1) {
    std::cerr << "completed batch must stay until cleanup\n";
    return 1;
  }
  manager.CleanupBatch("batch");
  if (manager.ActiveBatchCount() != 0) {
    std::cerr << "cleanup did not evict the batch\n";
    return 1;
  }

  {
    // Empty axes count as one slot; missing values come back as "".
    const GridExecutionState state = manager.InitializeBatch("empty", {}, {}, {});
    if (state.total_iterations() != 1) {
      std::cerr << "empty axes must yield one iteration\n";
      return 1;
    }
    const CurrentValues current = manager.GetCurrentValues("empty", {}, {}, {});
    if (AxisValueToString(current.x_value) != "" || current.x_index != 0) {
      std::cerr << "empty axis must give an empty value\n";
      return 1;
    }
  }

  {
    // State sized for three values, queried with one: out of range is "" and logged.
    manager.InitializeBatch("shrunk", {int64_t{1}, int64_t{2}, int64_t{3}}, {}, {});
    manager.AdvanceBatch("shrunk");
    manager.AdvanceBatch("shrunk");
    log.Clear();
    const CurrentValues current = manager.GetCurrentValues("shrunk", {int64_t{1}}, {}, {});
    if (AxisValueToString(current.x_value) != "" || current.x_index != 2) {
      std::cerr << "out-of-range index must give an empty value\n";
      return 1;
    }
    LogService::FilterOptions filter;
    filter.show_info = false;
    filter.show_errors = false;
    filter.category = "execution";
    if (log.GetFiltered(filter).empty()) {
      std::cerr << "out-of-range index must be logged as a warning\n";
      return 1;
    }
  }

  {
    // Independent stores do not share state.
    ExecutionManager other;
    if (other.ShouldContinue("shrunk")) {
      std::cerr << "stores must be isolated\n";
      return 1;
    }
  }

  {
    // Counts whose product overflows an int saturate instead of going negative.
    GridExecutionState huge("huge", 4096, 4096, 256);
    if (huge.total_iterations() != std::numeric_limits<int>::max() || huge.IsComplete()) {
      std::cerr << "oversized sweeps must not wrap to a negative total\n";
      return 1;
    }
  }

  std::cout << "execution state test passed\n";
  return 0;
}
