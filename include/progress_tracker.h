#ifndef PROGRESS_TRACKER_H
#define PROGRESS_TRACKER_H

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class LogService;

enum class GridStatus { Initializing, Running, Completed, Error };

std::string GridStatusName(GridStatus status);

struct GridProgress {
  std::string batch_id;
  int total_images = 0;
  int completed_images = 0;
  double start_time = 0.0;
  std::optional<double> end_time;
  std::map<std::string, std::string> current_labels;  // axis name -> label
  GridStatus status = GridStatus::Initializing;
  std::string error_message;

  double ProgressPercent() const;
  double ElapsedSeconds(double now) const;
  // Empty until at least one image has completed.
  std::optional<double> EstimatedRemainingSeconds(double now) const;
};

nlohmann::json GridProgressToJson(const GridProgress& progress, double now);

using ProgressCallback = std::function<void(const GridProgress& progress)>;
using ProgressClock = std::function<double()>;

// Per-batch progress for running sweeps plus a short history of finished ones.
class ProgressTracker {
 public:
  static constexpr size_t kHistorySize = 10;

  // The clock returns seconds; defaults to a monotonic clock.
  explicit ProgressTracker(LogService* log = nullptr, ProgressClock clock = nullptr);

  GridProgress StartGrid(const std::string& batch_id, int total_images);

  // Without `completed` the count increments by one. Reaching the total
  // completes the grid. Unknown batches return nothing.
  std::optional<GridProgress> UpdateProgress(
      const std::string& batch_id,
      std::optional<int> completed = std::nullopt,
      const std::map<std::string, std::string>& current_labels = {});

  std::optional<GridProgress> CompleteGrid(const std::string& batch_id);
  std::optional<GridProgress> ErrorGrid(const std::string& batch_id, const std::string& message);

  // Active grids first, then history.
  std::optional<GridProgress> GetProgress(const std::string& batch_id) const;
  std::vector<GridProgress> ActiveGrids() const;
  std::vector<GridProgress> History() const;

  void RegisterCallback(ProgressCallback callback);

  // {active_grids, completed_grids (last 5), total_active, total_completed}
  nlohmann::json SummaryJson() const;

  double Now() const;

 private:
  std::optional<GridProgress> FinishLocked(const std::string& batch_id, GridStatus status,
                                           const std::string& message);
  void Notify(const GridProgress& progress);

  LogService* log_ = nullptr;
  ProgressClock clock_;
  std::map<std::string, GridProgress> active_;
  std::deque<GridProgress> history_;
  std::vector<ProgressCallback> callbacks_;
  mutable std::mutex mutex_;
};

#endif  // PROGRESS_TRACKER_H
