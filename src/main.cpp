#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "axis_type.h"
#include "grid_controller.h"
#include "log_service.h"
#include "progress_tracker.h"
#include "queue_manager.h"
#include "self_test.h"
#include "string_utils.h"
#include "sweep_config.h"
#include "sweep_service.h"

namespace {
void PrintUsage() {
  std::cout
      << "Usage: xyz_grid [--config <file>] --x-type <type> --x-values <values> "
         "[--y-type <type> --y-values <values>] [--z-type <type> --z-values <values>] "
         "--validate|--plan|--simulate\n"
      << "Axis types: ";
  const std::vector<AxisType>& types = AllAxisTypes();
  for (size_t i = 0; i < types.size(); ++i) {
    if (i > 0) std::cout << "|";
    std::cout << AxisTypeToken(types[i]);
  }
  std::cout
      << "\n"
      << "Values: comma list (euler, ddim) or start:stop[:step] for numeric axes\n"
      << "Optional: --config <file> (load JSON sweep configuration)\n"
      << "Optional: --export-config <file> (write JSON sweep configuration)\n"
      << "Optional: --x-prefix/--y-prefix/--z-prefix <text> (label prefix)\n"
      << "Optional: --batch-id <id> (default: random 8-character id)\n"
      << "Optional: --no-param-names (labels without the parameter name)\n"
      << "Optional: --value-only-labels (labels show the bare value)\n"
      << "Optional: --font-size N (8-72) --grid-gap N (0-50) --label-height N (0-100)\n"
      << "Optional: --max-label-length N (10-100) --no-labels\n"
      << "Optional: --mode step|queue (execution mode for --simulate, default step)\n"
      << "Optional: --cell-size WxH (synthetic image size for --simulate, default 64x64)\n"
      << "Optional: --validate (parse inputs, print the grid configuration and exit)\n"
      << "Optional: --plan (print the queued execution list as JSON)\n"
      << "Optional: --simulate (run the sweep with synthetic images)\n"
      << "Optional: --progress (print progress updates while simulating)\n"
      << "Optional: --dump-log (print the engine log after running)\n"
      << "Optional: --self-test (run built-in regression suite)\n";
}

using json = nlohmann::json;

bool ParseIntArg(const std::string& flag, const std::string& text, int* out) {
  if (!xyz::ParseInt(text, out)) {
    std::cerr << flag << " expects an integer, got '" << text << "'\n";
    return false;
  }
  return true;
}

bool ParseCellSize(const std::string& text, int* width, int* height) {
  const std::vector<std::string> parts = xyz::Split(xyz::ToLower(text), 'x');
  int w = 0;
  int h = 0;
  if (parts.size() != 2 || !xyz::ParseInt(parts[0], &w) || !xyz::ParseInt(parts[1], &h) ||
      w <= 0 || h <= 0) {
    return false;
  }
  *width = w;
  *height = h;
  return true;
}

void DumpLog(const LogService& log) {
  for (const auto& line : log.GetLogs()) {
    std::cout << line << "\n";
  }
}

int RunPlan(const SweepConfig& config, LogService* log) {
  GridControllerRequest request = BuildControllerRequest(config);
  GridConfiguration grid;
  std::string error;
  if (!BuildGridConfiguration(request, &grid, &error, log)) {
    std::cerr << "config error: " << error << "\n";
    return 1;
  }
  GridQueueManager queue(nullptr, log);
  const std::vector<QueuedExecution> executions =
      queue.PrepareBatchExecutions(grid.batch_id, grid, grid.batch_id, json::object());
  json out;
  out["batch_id"] = grid.batch_id;
  out["total_iterations"] = grid.dimensions.total_images;
  out["executions"] = json::array();
  for (const auto& execution : executions) {
    out["executions"].push_back(QueuedExecutionToJson(execution));
  }
  std::cout << out.dump(2) << "\n";
  queue.CleanupBatch(grid.batch_id);
  return 0;
}

int RunSimulation(const SweepConfig& config, int cell_width, int cell_height, bool show_progress,
                  LogService* log) {
  ProgressTracker tracker(log);
  if (show_progress) {
    tracker.RegisterCallback([](const GridProgress& progress) {
      std::cout << "\r" << progress.batch_id << " " << progress.completed_images << "/"
                << progress.total_images << " (" << GridStatusName(progress.status) << ")"
                << std::flush;
    });
  }

  SweepRequest request;
  request.config = config;
  request.cell_width = cell_width;
  request.cell_height = cell_height;
  request.progress = &tracker;
  const SweepResponse response = ExecuteSweep(request, log);
  if (show_progress) {
    std::cout << "\n";
  }
  if (!response.ok) {
    std::cerr << "simulation error: " << response.error << "\n";
    return 1;
  }

  std::cout << "batch " << response.batch_id << ": " << response.ticks << " ticks, "
            << response.pages.size() << " page(s)\n";
  for (size_t i = 0; i < response.pages.size(); ++i) {
    std::cout << "  page " << i << ": " << response.pages[i].width << "x"
              << response.pages[i].height << "\n";
  }
  std::cout << response.info << "\n";
  if (show_progress) {
    std::cout << tracker.SummaryJson().dump(2) << "\n";
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  if (argc == 1) {
    PrintUsage();
    return 1;
  }

  std::string config_path;
  std::string export_config_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    }
    if (arg == "--self-test") {
      return RunSelfTest();
    }
    if (arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "--config requires a file path\n";
        return 1;
      }
      config_path = argv[++i];
      continue;
    }
    if (arg == "--export-config") {
      if (i + 1 >= argc) {
        std::cerr << "--export-config requires a file path\n";
        return 1;
      }
      export_config_path = argv[++i];
      continue;
    }
  }

  SweepConfig config;
  if (!config_path.empty()) {
    std::string config_error;
    if (!LoadSweepConfigFromFile(config_path, &config, &config_error)) {
      std::cerr << "config load error: " << config_error << "\n";
      return 1;
    }
  }

  bool validate_only = false;
  bool plan = false;
  bool simulate = false;
  bool show_progress = false;
  bool dump_log = false;
  int cell_width = 64;
  int cell_height = 64;

  // Command-line values override the loaded configuration.
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    const auto next_value = [&](std::string* out) {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires a value\n";
        return false;
      }
      *out = argv[++i];
      return true;
    };
    std::string value;
    if (arg == "--config" || arg == "--export-config") {
      ++i;
    } else if (arg == "--x-type") {
      if (!next_value(&config.x.type)) return 1;
    } else if (arg == "--x-values") {
      if (!next_value(&config.x.values)) return 1;
    } else if (arg == "--x-prefix") {
      if (!next_value(&config.x.label_prefix)) return 1;
    } else if (arg == "--y-type") {
      if (!next_value(&config.y.type)) return 1;
    } else if (arg == "--y-values") {
      if (!next_value(&config.y.values)) return 1;
    } else if (arg == "--y-prefix") {
      if (!next_value(&config.y.label_prefix)) return 1;
    } else if (arg == "--z-type") {
      if (!next_value(&config.z.type)) return 1;
    } else if (arg == "--z-values") {
      if (!next_value(&config.z.values)) return 1;
    } else if (arg == "--z-prefix") {
      if (!next_value(&config.z.label_prefix)) return 1;
    } else if (arg == "--batch-id") {
      if (!next_value(&config.batch_id)) return 1;
    } else if (arg == "--no-param-names") {
      config.include_param_name = false;
    } else if (arg == "--value-only-labels") {
      config.value_only_labels = true;
    } else if (arg == "--no-labels") {
      config.grid.include_labels = false;
    } else if (arg == "--font-size") {
      if (!next_value(&value) || !ParseIntArg(arg, value, &config.grid.font_size)) return 1;
    } else if (arg == "--grid-gap") {
      if (!next_value(&value) || !ParseIntArg(arg, value, &config.grid.grid_gap)) return 1;
    } else if (arg == "--label-height") {
      if (!next_value(&value) || !ParseIntArg(arg, value, &config.grid.label_height)) return 1;
    } else if (arg == "--max-label-length") {
      if (!next_value(&value) || !ParseIntArg(arg, value, &config.grid.max_label_length)) {
        return 1;
      }
    } else if (arg == "--mode") {
      if (!next_value(&value)) return 1;
      config.execution_mode = xyz::ToLower(value);
    } else if (arg == "--cell-size") {
      if (!next_value(&value)) return 1;
      if (!ParseCellSize(value, &cell_width, &cell_height)) {
        std::cerr << "--cell-size expects WxH with positive integers\n";
        return 1;
      }
    } else if (arg == "--validate") {
      validate_only = true;
    } else if (arg == "--plan") {
      plan = true;
    } else if (arg == "--simulate") {
      simulate = true;
    } else if (arg == "--progress") {
      show_progress = true;
    } else if (arg == "--dump-log") {
      dump_log = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage();
      return 1;
    }
  }

  std::string config_error;
  if (!ValidateSweepConfig(config, &config_error)) {
    std::cerr << "config error: " << config_error << "\n";
    return 1;
  }

  if (!export_config_path.empty()) {
    std::string export_error;
    if (!SaveSweepConfigToFile(export_config_path, config, &export_error)) {
      std::cerr << "config export error: " << export_error << "\n";
      return 1;
    }
    std::cout << "config exported: " << export_config_path << "\n";
  }

  LogService log;
  int status = 0;
  if (validate_only) {
    GridConfiguration grid;
    std::string error;
    if (!BuildGridConfiguration(BuildControllerRequest(config), &grid, &error, &log)) {
      std::cerr << "config error: " << error << "\n";
      status = 1;
    } else {
      std::cout << SerializeGridConfiguration(grid) << "\n";
    }
  } else if (plan) {
    status = RunPlan(config, &log);
  } else if (simulate) {
    status = RunSimulation(config, cell_width, cell_height, show_progress, &log);
  } else if (export_config_path.empty()) {
    std::cerr << "Nothing to do: pass --validate, --plan or --simulate\n";
    status = 1;
  }

  if (dump_log) {
    DumpLog(log);
  }
  return status;
}
