#include "log_service.h"
#include "progress_tracker.h"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
int failures = 0;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    failures++;
  }
}

bool Near(double a, double b) {
  return std::abs(a - b) < 1e-9;
}
}  // namespace

int main() {
  LogService log;
  double now = 100.0;
  ProgressTracker tracker(&log, [&now]() { return now; });

  std::vector<std::string> seen;
  tracker.RegisterCallback([&seen](const GridProgress& progress) {
    seen.push_back(progress.batch_id + ":" + std::to_string(progress.completed_images) + ":" +
                   GridStatusName(progress.status));
  });

  // Timing and ETA.
  {
    const GridProgress started = tracker.StartGrid("eta", 4);
    Expect(started.status == GridStatus::Running && Near(started.start_time, 100.0),
           "grid starts running at the clock time");
    Expect(!started.EstimatedRemainingSeconds(now).has_value(), "no ETA before the first image");

    now = 110.0;
    const auto one = tracker.UpdateProgress("eta", std::nullopt, {{"x", "Sampler: euler"}});
    Expect(one && one->completed_images == 1, "update without a count increments");
    Expect(one && Near(one->ProgressPercent(), 25.0), "25 percent after one of four");
    Expect(one && Near(*one->EstimatedRemainingSeconds(now), 30.0),
           "ETA extrapolates the per-image time");
    Expect(one && one->current_labels.at("x") == "Sampler: euler", "labels are recorded");

    const nlohmann::json snapshot = GridProgressToJson(*one, now);
    Expect(snapshot["progress_percent"] == 25.0 && snapshot["elapsed_time"] == 10.0 &&
               snapshot["estimated_remaining"] == 30.0 && snapshot["status"] == "running" &&
               snapshot["error_message"].is_null(),
           "snapshot JSON: " + snapshot.dump());

    now = 120.0;
    const auto three = tracker.UpdateProgress("eta", 3);
    Expect(three && three->completed_images == 3 && three->status == GridStatus::Running,
           "explicit count is taken as is");
    Expect(three && three->current_labels.size() == 1, "labels persist when none are given");

    now = 125.0;
    const auto done = tracker.UpdateProgress("eta", std::nullopt);
    Expect(done && done->status == GridStatus::Completed && done->end_time &&
               Near(*done->end_time, 125.0),
           "reaching the total completes the grid");
    now = 500.0;
    Expect(done && Near(done->ElapsedSeconds(now), 25.0), "elapsed time stops at completion");
    Expect(tracker.ActiveGrids().empty() && tracker.History().size() == 1,
           "completed grid moves to history");
    const auto lookup = tracker.GetProgress("eta");
    Expect(lookup && lookup->status == GridStatus::Completed, "history is searched");
    Expect(!tracker.UpdateProgress("eta", 1), "finished grids take no updates");
  }

  Expect(!seen.empty() && seen.front() == "eta:0:running" && seen.back() == "eta:4:completed",
         "callbacks see start and completion");

  // Errors.
  {
    tracker.StartGrid("broken", 2);
    const auto failed = tracker.ErrorGrid("broken", "image shape mismatch");
    Expect(failed && failed->status == GridStatus::Error &&
               failed->error_message == "image shape mismatch",
           "ErrorGrid records the message");
    Expect(!tracker.ErrorGrid("broken", "again"), "errors on unknown grids are ignored");
    Expect(!tracker.CompleteGrid("never-started"), "unknown grids cannot complete");
    Expect(!tracker.GetProgress("never-started"), "unknown grids have no progress");
  }

  // A throwing callback is logged and does not stop the others.
  {
    int calls = 0;
    tracker.RegisterCallback([](const GridProgress&) {
      throw std::runtime_error("display gone");
    });
    tracker.RegisterCallback([&calls](const GridProgress&) { calls++; });
    log.Clear();
    tracker.StartGrid("callbacks", 1);
    Expect(calls == 1, "later callbacks still run");
    LogService::FilterOptions filter;
    filter.show_info = false;
    filter.show_warnings = false;
    filter.search_text = "display gone";
    Expect(log.GetFiltered(filter).size() == 1, "callback failure is logged");
    tracker.CompleteGrid("callbacks");
  }

  // Callbacks that throw something other than std::exception are contained too.
  {
    LogService quiet_log;
    ProgressTracker isolated(&quiet_log, [&now]() { return now; });
    int calls = 0;
    isolated.RegisterCallback([](const GridProgress&) { throw 42; });
    isolated.RegisterCallback([&calls](const GridProgress&) { calls++; });
    bool escaped = false;
    try {
      isolated.StartGrid("foreign", 2);
      isolated.UpdateProgress("foreign");
    } catch (...) {
      escaped = true;
    }
    Expect(!escaped && calls == 2, "non-standard exceptions do not escape the tracker");
    LogService::FilterOptions filter;
    filter.show_info = false;
    filter.show_warnings = false;
    filter.search_text = "unknown exception";
    Expect(quiet_log.GetFiltered(filter).size() == 2, "foreign exceptions are logged");
  }

  // History is bounded; the summary shows the latest few.
  {
    for (int i = 0; i < 12; ++i) {
      const std::string id = "batch-" + std::to_string(i);
      tracker.StartGrid(id, 1);
      tracker.UpdateProgress(id);
    }
    tracker.StartGrid("running", 10);
    Expect(tracker.History().size() == ProgressTracker::kHistorySize, "history is capped");
    Expect(tracker.History().back().batch_id == "batch-11", "newest entry is last");
    Expect(!tracker.GetProgress("batch-0"), "oldest entries are evicted");

    const nlohmann::json summary = tracker.SummaryJson();
    Expect(summary["total_active"] == 1 && summary["total_completed"] == 10,
           "summary totals: " + summary.dump());
    Expect(summary["completed_grids"].size() == 5 &&
               summary["completed_grids"].back()["batch_id"] == "batch-11" &&
               summary["completed_grids"].front()["batch_id"] == "batch-7",
           "summary lists the last five grids");
    Expect(summary["active_grids"][0]["estimated_remaining"].is_null(),
           "active grid without images has no ETA");
  }

  if (failures != 0) {
    std::cerr << failures << " progress tracker check(s) failed\n";
    return 1;
  }
  std::cout << "progress tracker test passed\n";
  return 0;
}
