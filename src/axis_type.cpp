#include "axis_type.h"

#include <limits>
#include <sstream>

#include "string_utils.h"

namespace {

struct AxisTypeInfo {
  AxisType type;
  const char* token;
  const char* display_name;
};

const AxisTypeInfo kAxisTypes[] = {
    {AxisType::None, "none", "None"},
    {AxisType::Model, "model", "Model/Checkpoint"},
    {AxisType::Vae, "vae", "VAE"},
    {AxisType::Lora, "lora", "LoRA"},
    {AxisType::Sampler, "sampler", "Sampler"},
    {AxisType::Scheduler, "scheduler", "Scheduler"},
    {AxisType::CfgScale, "cfg_scale", "CFG Scale"},
    {AxisType::Steps, "steps", "Steps"},
    {AxisType::Seed, "seed", "Seed"},
    {AxisType::Denoise, "denoise", "Denoise"},
    {AxisType::ClipSkip, "clip_skip", "Clip Skip"},
    {AxisType::Prompt, "prompt", "Prompt"},
    {AxisType::FluxGuidance, "flux_guidance", "Flux Guidance"},
};

const AxisTypeInfo* FindInfo(AxisType type) {
  for (const auto& info : kAxisTypes) {
    if (info.type == type) {
      return &info;
    }
  }
  return nullptr;
}

}  // namespace

const std::vector<AxisType>& AllAxisTypes() {
  static const std::vector<AxisType> types = [] {
    std::vector<AxisType> out;
    for (const auto& info : kAxisTypes) {
      out.push_back(info.type);
    }
    return out;
  }();
  return types;
}

bool IsAxisTypeToken(const std::string& text) {
  return ParseAxisTypeToken(text, nullptr);
}

bool ParseAxisTypeToken(const std::string& text, AxisType* out) {
  const std::string token = xyz::ToLower(xyz::Trim(text));
  for (const auto& info : kAxisTypes) {
    if (token == info.token) {
      if (out) {
        *out = info.type;
      }
      return true;
    }
  }
  return false;
}

AxisType ParseAxisType(const std::string& text) {
  AxisType type = AxisType::None;
  if (!ParseAxisTypeToken(text, &type)) {
    return AxisType::None;
  }
  return type;
}

std::string AxisTypeToken(AxisType type) {
  const AxisTypeInfo* info = FindInfo(type);
  return info ? info->token : "none";
}

std::string AxisTypeDisplayName(AxisType type) {
  const AxisTypeInfo* info = FindInfo(type);
  return info ? info->display_name : "None";
}

OutputType GetOutputType(AxisType type) {
  switch (type) {
    case AxisType::Steps:
    case AxisType::ClipSkip:
    case AxisType::Seed:
      return OutputType::Int;
    case AxisType::CfgScale:
    case AxisType::FluxGuidance:
    case AxisType::Denoise:
      return OutputType::Float;
    case AxisType::Model:
    case AxisType::Vae:
    case AxisType::Lora:
    case AxisType::Sampler:
    case AxisType::Scheduler:
    case AxisType::Prompt:
    case AxisType::None:
    default:
      return OutputType::String;
  }
}

std::string OutputTypeName(OutputType type) {
  switch (type) {
    case OutputType::Int:
      return "INT";
    case OutputType::Float:
      return "FLOAT";
    case OutputType::String:
    default:
      return "STRING";
  }
}

bool IsNumericAxis(AxisType type) {
  return GetNumericDefaults(type, nullptr);
}

bool IsIntegerAxis(AxisType type) {
  return GetOutputType(type) == OutputType::Int;
}

bool IsFloatAxis(AxisType type) {
  return GetOutputType(type) == OutputType::Float;
}

bool GetNumericDefaults(AxisType type, NumericDefaults* out) {
  NumericDefaults defaults;
  switch (type) {
    case AxisType::CfgScale:
      defaults = {7.0, 0.0, 30.0, 0.5};
      break;
    case AxisType::Steps:
      defaults = {20.0, 1.0, 150.0, 1.0};
      break;
    case AxisType::ClipSkip:
      defaults = {1.0, 1.0, 12.0, 1.0};
      break;
    case AxisType::Seed:
      defaults = {0.0, 0.0, static_cast<double>(std::numeric_limits<uint64_t>::max()), 0.0};
      break;
    case AxisType::FluxGuidance:
      defaults = {3.5, 0.0, 10.0, 0.1};
      break;
    case AxisType::Denoise:
      defaults = {1.0, 0.0, 1.0, 0.05};
      break;
    default:
      return false;
  }
  if (out) {
    *out = defaults;
  }
  return true;
}

OutputType AxisValueType(const AxisValue& value) {
  if (std::holds_alternative<int64_t>(value) || std::holds_alternative<uint64_t>(value)) {
    return OutputType::Int;
  }
  if (std::holds_alternative<double>(value)) {
    return OutputType::Float;
  }
  return OutputType::String;
}

std::string AxisValueToString(const AxisValue& value) {
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    return std::to_string(*integer);
  }
  if (const auto* seed = std::get_if<uint64_t>(&value)) {
    return std::to_string(*seed);
  }
  // Floats keep at least one decimal so "5" never reads as an integer value.
  std::ostringstream out;
  out.precision(15);
  out << std::get<double>(value);
  std::string text = out.str();
  if (text.find_first_of(".eEn") == std::string::npos) {
    text += ".0";
  }
  return text;
}
