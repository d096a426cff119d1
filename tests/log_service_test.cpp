#include "log_service.h"

#include <iostream>
#include <string>
#include <vector>

int main() {
  LogService log;
  log.Info("queue", "prepared 4 executions");
  log.Warning("controller", "X axis: Value must be positive (got 0)");
  log.Error("compositor", "image 9x8x3 does not match 8x8x3");
  log.Info("queue", "   ");

  if (log.Size() != 3) {
    std::cerr << "blank messages must be dropped, got " << log.Size() << " lines\n";
    return 1;
  }
  const std::vector<std::string> lines = log.GetLogs();
  if (lines[1] != "[controller] warning: X axis: Value must be positive (got 0)") {
    std::cerr << "unexpected line format: " << lines[1] << "\n";
    return 1;
  }

  LogService::FilterOptions only_errors;
  only_errors.show_info = false;
  only_errors.show_warnings = false;
  if (log.GetFiltered(only_errors).size() != 1) {
    std::cerr << "error filter mismatch\n";
    return 1;
  }

  LogService::FilterOptions by_category;
  by_category.category = "queue";
  if (log.GetFiltered(by_category).size() != 1) {
    std::cerr << "category filter mismatch\n";
    return 1;
  }

  LogService::FilterOptions by_text;
  by_text.search_text = "8X8";
  if (log.GetFiltered(by_text).size() != 1) {
    std::cerr << "search must be case-insensitive\n";
    return 1;
  }

  LogService copy(log);
  log.Clear();
  if (log.Size() != 0 || copy.Size() != 3) {
    std::cerr << "copies must be independent of Clear()\n";
    return 1;
  }

  for (int i = 0; i < 2100; ++i) {
    log.Info("progress", "tick " + std::to_string(i));
  }
  const std::vector<std::string> capped = log.GetLogs();
  if (capped.size() != 2000 || capped.front() != "[progress] tick 100") {
    std::cerr << "log must keep the newest 2000 lines\n";
    return 1;
  }

  std::cout << "log service test passed\n";
  return 0;
}
