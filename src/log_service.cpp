#include "log_service.h"

#include "string_utils.h"

namespace {

bool ContainsCaseInsensitive(const std::string& text, const std::string& needle) {
  if (needle.empty()) return true;
  return xyz::ToLower(text).find(xyz::ToLower(needle)) != std::string::npos;
}

bool IsError(const std::string& line) {
  return ContainsCaseInsensitive(line, "error");
}

bool IsWarning(const std::string& line) {
  return ContainsCaseInsensitive(line, "warning");
}

bool HasCategory(const std::string& line, const std::string& category) {
  if (category.empty()) return true;
  return line.compare(0, category.size() + 2, "[" + category + "]") == 0;
}

}  // namespace

LogService::LogService(const LogService& other) {
  std::lock_guard<std::mutex> lock(other.mutex_);
  logs_ = other.logs_;
}

LogService& LogService::operator=(const LogService& other) {
  if (this == &other) {
    return *this;
  }
  std::scoped_lock lock(mutex_, other.mutex_);
  logs_ = other.logs_;
  return *this;
}

void LogService::Append(const std::string& category, const std::string& message) {
  if (xyz::Trim(message).empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.push_back("[" + category + "] " + message);
  if (logs_.size() > static_cast<size_t>(kMaxLogs)) {
    const size_t start = logs_.size() - static_cast<size_t>(kMaxLogs);
    logs_.erase(logs_.begin(), logs_.begin() + static_cast<std::ptrdiff_t>(start));
  }
}

void LogService::Info(const std::string& category, const std::string& message) {
  Append(category, message);
}

void LogService::Warning(const std::string& category, const std::string& message) {
  Append(category, "warning: " + message);
}

void LogService::Error(const std::string& category, const std::string& message) {
  Append(category, "error: " + message);
}

void LogService::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.clear();
}

std::vector<std::string> LogService::GetFiltered(const FilterOptions& opts) const {
  std::vector<std::string> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& line : logs_) {
    if (!HasCategory(line, opts.category)) continue;

    const bool error_line = IsError(line);
    const bool warning_line = IsWarning(line);

    if (error_line && !opts.show_errors) continue;
    if (warning_line && !opts.show_warnings) continue;
    if (!error_line && !warning_line && !opts.show_info) continue;

    if (!opts.search_text.empty() && !ContainsCaseInsensitive(line, opts.search_text)) {
      continue;
    }
    out.push_back(line);
  }
  return out;
}

std::vector<std::string> LogService::GetLogs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logs_;
}

size_t LogService::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logs_.size();
}
