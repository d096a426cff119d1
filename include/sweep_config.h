#ifndef SWEEP_CONFIG_H
#define SWEEP_CONFIG_H

#include <filesystem>
#include <string>

#include "grid_compositor.h"
#include "grid_controller.h"

struct SweepAxisConfig {
  std::string type = "none";
  std::string values;        // raw comma list or start:stop[:step]
  std::string label_prefix;
};

struct SweepConfig {
  int schema_version = 1;
  std::string batch_id;      // empty: generated per run

  SweepAxisConfig x;
  SweepAxisConfig y;
  SweepAxisConfig z;

  bool include_param_name = true;
  bool value_only_labels = false;

  CompositorOptions grid;

  std::string execution_mode = "step";  // "step" or "queue"
};

bool LoadSweepConfigFromFile(const std::filesystem::path& path,
                             SweepConfig* config,
                             std::string* error);
bool LoadSweepConfigFromString(const std::string& content,
                               SweepConfig* config,
                               std::string* error);
bool SaveSweepConfigToFile(const std::filesystem::path& path,
                           const SweepConfig& config,
                           std::string* error);
std::string SerializeSweepConfig(const SweepConfig& config, int indent = 2);

bool ValidateSweepConfig(const SweepConfig& config, std::string* error);

GridControllerRequest BuildControllerRequest(const SweepConfig& config);

#endif  // SWEEP_CONFIG_H
