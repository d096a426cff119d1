#include "progress_tracker.h"

#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

#include "log_service.h"

namespace {

using json = nlohmann::json;

constexpr const char* kLogCategory = "progress";
constexpr size_t kSummaryHistory = 5;

double Round1(double value) {
  return std::round(value * 10.0) / 10.0;
}

double SteadySeconds() {
  using clock = std::chrono::steady_clock;
  return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
}

}  // namespace

std::string GridStatusName(GridStatus status) {
  switch (status) {
    case GridStatus::Initializing:
      return "initializing";
    case GridStatus::Running:
      return "running";
    case GridStatus::Completed:
      return "completed";
    case GridStatus::Error:
      return "error";
  }
  return "unknown";
}

double GridProgress::ProgressPercent() const {
  if (total_images <= 0) {
    return 0.0;
  }
  return 100.0 * static_cast<double>(completed_images) / static_cast<double>(total_images);
}

double GridProgress::ElapsedSeconds(double now) const {
  const double end = end_time ? *end_time : now;
  return end - start_time;
}

std::optional<double> GridProgress::EstimatedRemainingSeconds(double now) const {
  if (completed_images <= 0) {
    return std::nullopt;
  }
  const double per_image = ElapsedSeconds(now) / static_cast<double>(completed_images);
  return per_image * static_cast<double>(total_images - completed_images);
}

json GridProgressToJson(const GridProgress& progress, double now) {
  json out;
  out["batch_id"] = progress.batch_id;
  out["total_images"] = progress.total_images;
  out["completed_images"] = progress.completed_images;
  out["progress_percent"] = Round1(progress.ProgressPercent());
  out["elapsed_time"] = Round1(progress.ElapsedSeconds(now));
  const std::optional<double> remaining = progress.EstimatedRemainingSeconds(now);
  out["estimated_remaining"] = remaining ? json(Round1(*remaining)) : json(nullptr);
  out["current_labels"] = progress.current_labels;
  out["status"] = GridStatusName(progress.status);
  out["error_message"] =
      progress.error_message.empty() ? json(nullptr) : json(progress.error_message);
  return out;
}

ProgressTracker::ProgressTracker(LogService* log, ProgressClock clock)
    : log_(log), clock_(clock ? std::move(clock) : ProgressClock(SteadySeconds)) {}

double ProgressTracker::Now() const {
  return clock_();
}

GridProgress ProgressTracker::StartGrid(const std::string& batch_id, int total_images) {
  GridProgress progress;
  progress.batch_id = batch_id;
  progress.total_images = total_images;
  progress.start_time = Now();
  progress.status = GridStatus::Running;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[batch_id] = progress;
  }
  if (log_) {
    log_->Info(kLogCategory, "started grid " + batch_id + " (" + std::to_string(total_images) +
                                 " images)");
  }
  Notify(progress);
  return progress;
}

std::optional<GridProgress> ProgressTracker::UpdateProgress(
    const std::string& batch_id,
    std::optional<int> completed,
    const std::map<std::string, std::string>& current_labels) {
  GridProgress snapshot;
  bool finished = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(batch_id);
    if (it == active_.end()) {
      return std::nullopt;
    }
    GridProgress& progress = it->second;
    progress.completed_images = completed ? *completed : progress.completed_images + 1;
    if (!current_labels.empty()) {
      progress.current_labels = current_labels;
    }
    snapshot = progress;
    finished = progress.completed_images >= progress.total_images;
  }
  Notify(snapshot);
  if (finished) {
    return CompleteGrid(batch_id);
  }
  return snapshot;
}

std::optional<GridProgress> ProgressTracker::CompleteGrid(const std::string& batch_id) {
  std::optional<GridProgress> done;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done = FinishLocked(batch_id, GridStatus::Completed, std::string());
  }
  if (done) {
    if (log_) {
      log_->Info(kLogCategory, "grid " + batch_id + " completed in " +
                                   std::to_string(done->ElapsedSeconds(Now())) + " s");
    }
    Notify(*done);
  }
  return done;
}

std::optional<GridProgress> ProgressTracker::ErrorGrid(const std::string& batch_id,
                                                       const std::string& message) {
  std::optional<GridProgress> done;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done = FinishLocked(batch_id, GridStatus::Error, message);
  }
  if (done) {
    if (log_) {
      log_->Error(kLogCategory, "grid " + batch_id + " failed: " + message);
    }
    Notify(*done);
  }
  return done;
}

std::optional<GridProgress> ProgressTracker::FinishLocked(const std::string& batch_id,
                                                          GridStatus status,
                                                          const std::string& message) {
  auto it = active_.find(batch_id);
  if (it == active_.end()) {
    return std::nullopt;
  }
  GridProgress progress = std::move(it->second);
  active_.erase(it);
  progress.status = status;
  progress.error_message = message;
  progress.end_time = Now();
  history_.push_back(progress);
  while (history_.size() > kHistorySize) {
    history_.pop_front();
  }
  return progress;
}

std::optional<GridProgress> ProgressTracker::GetProgress(const std::string& batch_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(batch_id);
  if (it != active_.end()) {
    return it->second;
  }
  for (const auto& progress : history_) {
    if (progress.batch_id == batch_id) {
      return progress;
    }
  }
  return std::nullopt;
}

std::vector<GridProgress> ProgressTracker::ActiveGrids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<GridProgress> out;
  out.reserve(active_.size());
  for (const auto& entry : active_) {
    out.push_back(entry.second);
  }
  return out;
}

std::vector<GridProgress> ProgressTracker::History() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<GridProgress>(history_.begin(), history_.end());
}

void ProgressTracker::RegisterCallback(ProgressCallback callback) {
  if (!callback) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

json ProgressTracker::SummaryJson() const {
  const double now = Now();
  std::lock_guard<std::mutex> lock(mutex_);
  json summary;
  summary["active_grids"] = json::array();
  for (const auto& entry : active_) {
    summary["active_grids"].push_back(GridProgressToJson(entry.second, now));
  }
  summary["completed_grids"] = json::array();
  const size_t skip = history_.size() > kSummaryHistory ? history_.size() - kSummaryHistory : 0;
  for (size_t i = skip; i < history_.size(); ++i) {
    summary["completed_grids"].push_back(GridProgressToJson(history_[i], now));
  }
  summary["total_active"] = active_.size();
  summary["total_completed"] = history_.size();
  return summary;
}

void ProgressTracker::Notify(const GridProgress& progress) {
  std::vector<ProgressCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = callbacks_;
  }
  for (const auto& callback : callbacks) {
    try {
      callback(progress);
    } catch (const std::exception& e) {
      if (log_) {
        log_->Error(kLogCategory, std::string("progress callback failed: ") + e.what());
      }
    } catch (...) {
      // Host callbacks may throw any type.
      if (log_) {
        log_->Error(kLogCategory, "progress callback failed: unknown exception");
      }
    }
  }
}
