#include "axis_labels.h"
#include "execution_state.h"
#include "queue_manager.h"

#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {
GridConfiguration MakeConfig() {
  GridConfiguration config;
  config.batch_id = "queue";
  config.axes.x.type = AxisType::Sampler;
  config.axes.x.values = {std::string("euler"), std::string("ddim"), std::string("lms")};
  config.axes.y.type = AxisType::Steps;
  config.axes.y.values = {int64_t{10}, int64_t{20}};
  config.axes.z.type = AxisType::CfgScale;
  config.axes.z.values = {5.0, 7.5};
  config.dimensions = CalculateGridDimensions(3, 2, 2);
  return config;
}
// Forwards to an in-memory store and counts copying and mutating accesses.
class CountingStore : public QueueStore {
 public:
  bool Find(const std::string& batch_id, QueuedBatch* out) const override {
    ++copies;
    return inner_.Find(batch_id, out);
  }
  void Put(const std::string& batch_id, QueuedBatch value) override {
    inner_.Put(batch_id, std::move(value));
  }
  bool Visit(const std::string& batch_id,
             const std::function<void(const QueuedBatch&)>& fn) const override {
    return inner_.Visit(batch_id, fn);
  }
  bool Modify(const std::string& batch_id,
              const std::function<void(QueuedBatch*)>& fn) override {
    ++writes;
    return inner_.Modify(batch_id, fn);
  }
  bool Take(const std::string& batch_id, QueuedBatch* out) override {
    return inner_.Take(batch_id, out);
  }
  bool Erase(const std::string& batch_id) override { return inner_.Erase(batch_id); }
  bool Contains(const std::string& batch_id) const override { return inner_.Contains(batch_id); }
  size_t Size() const override { return inner_.Size(); }
  void Clear() override { inner_.Clear(); }

  mutable int copies = 0;
  int writes = 0;

 private:
  InMemoryBatchStore<QueuedBatch> inner_;
};
}  // namespace

int main() {
  auto store = std::make_shared<InMemoryBatchStore<QueuedBatch>>();
  GridQueueManager queue(store);
  const GridConfiguration config = MakeConfig();
  const nlohmann::json payload = {{"prompt", "a lighthouse"}, {"nodes", {1, 2, 3}}};

  const std::vector<QueuedExecution> executions =
      queue.PrepareBatchExecutions("queue", config, "ctx-1", payload);
  if (executions.size() != 12) {
    std::cerr << "expected 12 executions, got " << executions.size() << "\n";
    return 1;
  }

  // Same order as the single-step iterator.
  GridExecutionState state("queue", 3, 2, 2);
  std::set<std::string> ids;
  for (size_t i = 0; i < executions.size(); ++i) {
    const QueuedExecution& execution = executions[i];
    const ExecutionIndices idx = state.GetIndices();
    if (execution.iteration != static_cast<int>(i) || execution.x_index != idx.x ||
        execution.y_index != idx.y || execution.z_index != idx.z) {
      std::cerr << "execution " << i << " out of step with GridExecutionState\n";
      return 1;
    }
    if (execution.total_iterations != 12 || execution.batch_id != "queue") {
      std::cerr << "execution " << i << " has wrong batch bookkeeping\n";
      return 1;
    }
    ids.insert(execution.execution_id);
    state.Advance();
  }
  if (ids.size() != executions.size()) {
    std::cerr << "execution ids must be unique\n";
    return 1;
  }
  if (std::get<std::string>(executions[1].x_value) != "ddim" ||
      std::get<int64_t>(executions[3].y_value) != 20 ||
      std::get<double>(executions[6].z_value) != 7.5) {
    std::cerr << "execution values do not follow their indices\n";
    return 1;
  }

  // Payload copies are independent and annotated with their cell.
  const nlohmann::json& annotated = executions[4].payload;
  if (annotated.value("prompt", "") != "a lighthouse" || !annotated.contains("xyz_grid") ||
      annotated["xyz_grid"]["iteration"] != 4 || annotated["xyz_grid"]["context_id"] != "ctx-1" ||
      annotated["xyz_grid"]["values"]["x"] != "ddim") {
    std::cerr << "payload annotation missing or wrong: " << annotated.dump() << "\n";
    return 1;
  }
  if (payload.contains("xyz_grid")) {
    std::cerr << "caller payload must not be modified\n";
    return 1;
  }
  {
    const std::vector<QueuedExecution> raw =
        queue.PrepareBatchExecutions("raw", config, "ctx", nlohmann::json("opaque"));
    if (raw.front().payload != nlohmann::json("opaque")) {
      std::cerr << "non-object payloads are copied verbatim\n";
      return 1;
    }
    queue.CleanupBatch("raw");
  }

  const nlohmann::json serialized = QueuedExecutionToJson(executions[5]);
  if (serialized["indices"]["x"] != 2 || serialized["indices"]["y"] != 1 ||
      serialized["values"]["y"] != 20 || serialized.contains("payload")) {
    std::cerr << "unexpected serialized execution: " << serialized.dump() << "\n";
    return 1;
  }

  // Completion tracking.
  if (queue.IsBatchComplete("queue") || queue.CompletedCount("queue") != 0) {
    std::cerr << "fresh batch must not be complete\n";
    return 1;
  }
  queue.MarkIterationComplete("queue", 0);
  queue.MarkIterationComplete("queue", 0);
  queue.MarkIterationComplete("queue", 2);
  if (queue.CompletedCount("queue") != 2) {
    std::cerr << "marking must be idempotent\n";
    return 1;
  }
  queue.MarkIterationComplete("queue", -1);
  queue.MarkIterationComplete("queue", 12);
  queue.MarkIterationComplete("queue", 1000);
  if (queue.CompletedCount("queue") != 2 || queue.IsBatchComplete("queue")) {
    std::cerr << "out-of-range iterations must not count as completed\n";
    return 1;
  }
  const auto next = queue.GetNextExecution("queue");
  if (!next || next->iteration != 1) {
    std::cerr << "next execution must be the first pending one\n";
    return 1;
  }
  if (queue.PendingExecutions("queue").size() != 10) {
    std::cerr << "pending list size mismatch\n";
    return 1;
  }
  for (int i = 0; i < 12; ++i) {
    queue.MarkIterationComplete("queue", i);
  }
  if (!queue.IsBatchComplete("queue") || queue.GetNextExecution("queue")) {
    std::cerr << "batch must be complete with nothing pending\n";
    return 1;
  }

  if (!queue.IsBatchComplete("never-prepared")) {
    std::cerr << "unknown batches count as complete\n";
    return 1;
  }
  if (queue.GetNextExecution("never-prepared")) {
    std::cerr << "unknown batch has no next execution\n";
    return 1;
  }

  queue.CleanupBatch("queue");
  if (queue.ActiveBatchCount() != 0 || store->Size() != 0) {
    std::cerr << "cleanup must evict the batch\n";
    return 1;
  }

  {
    // Read-only queries neither copy the batch nor go through the write path.
    auto counting = std::make_shared<CountingStore>();
    GridQueueManager counted(counting);
    counted.PrepareBatchExecutions("reads", config, "", payload);
    counted.MarkIterationComplete("reads", 0);
    const GridQueueManager& reader = counted;
    const auto first_pending = reader.GetNextExecution("reads");
    const size_t pending = reader.PendingExecutions("reads").size();
    const bool complete = reader.IsBatchComplete("reads");
    const int done = reader.CompletedCount("reads");
    if (!first_pending || first_pending->iteration != 1 || pending != 11 || complete ||
        done != 1) {
      std::cerr << "read-only queries returned wrong values\n";
      return 1;
    }
    if (counting->copies != 0 || counting->writes != 1) {
      std::cerr << "read-only queries must read in place: copies=" << counting->copies
                << " writes=" << counting->writes << "\n";
      return 1;
    }
  }

  {
    // Oversized sweeps are refused before anything is queued.
    GridConfiguration huge;
    huge.batch_id = "huge";
    huge.axes.x.type = AxisType::Steps;
    huge.axes.y.type = AxisType::Seed;
    for (int i = 0; i < 400; ++i) {
      huge.axes.x.values.push_back(int64_t{i + 1});
      huge.axes.y.values.push_back(uint64_t(i));
    }
    huge.dimensions = CalculateGridDimensions(400, 400, 1);
    if (!queue.PrepareBatchExecutions("huge", huge, "", nlohmann::json::object()).empty() ||
        queue.ActiveBatchCount() != 0) {
      std::cerr << "batches above the image limit must not be queued\n";
      return 1;
    }
  }

  {
    // Unconfigured axes contribute a single "" slot.
    GridConfiguration single;
    single.batch_id = "single";
    single.axes.x.type = AxisType::Seed;
    single.axes.x.values = {int64_t{1}, int64_t{2}};
    single.dimensions = CalculateGridDimensions(2, 1, 1);
    const std::vector<QueuedExecution> two =
        queue.PrepareBatchExecutions("single", single, "", nlohmann::json::object());
    if (two.size() != 2 || std::get<std::string>(two[0].y_value) != "" ||
        std::get<std::string>(two[1].z_value) != "") {
      std::cerr << "empty axes must use the empty placeholder\n";
      return 1;
    }
  }

  std::cout << "queue manager test passed\n";
  return 0;
}
