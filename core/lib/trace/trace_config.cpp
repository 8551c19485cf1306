// open_union/trace/trace_config.cpp - Trace configuration implementation
//
#include "open_union/trace/trace_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace open_union
{

namespace
{

std::mutex & config_mutex()
{
  static std::mutex mutex;
  return mutex;
}

TraceConfig & config_storage()
{
  static TraceConfig config = apply_environment(TraceConfig{});
  return config;
}

/// Read a boolean switch from the environment
std::optional<bool> env_switch(const char * name)
{
  const char * raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }

  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return !(value == "0" || value == "false" || value == "off" || value == "no");
}

}  // namespace

ConfigLoadResult load_trace_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  TraceConfig config;

  if (!root["trace"]) {
    return ConfigLoadResult::ok(config);
  }

  const YAML::Node trace = root["trace"];
  if (!trace.IsMap()) {
    return ConfigLoadResult::fail("'trace' must be a map");
  }

  try {
    if (trace["backtrace"]) {
      config.capture_backtrace = trace["backtrace"].as<bool>();
    }

    if (trace["max_frames"]) {
      const int frames = trace["max_frames"].as<int>();
      if (frames <= 0) {
        return ConfigLoadResult::fail(
          "invalid trace.max_frames: " + std::to_string(frames) + " (must be positive)");
      }
      config.max_backtrace_frames = static_cast<std::size_t>(frames);
    }

    if (trace["display_context"]) {
      config.display_context = trace["display_context"].as<bool>();
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid trace setting: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(config);
}

std::optional<std::filesystem::path> find_trace_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_trace_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

TraceConfig apply_environment(TraceConfig base)
{
  if (const auto backtrace = env_switch("OPEN_UNION_BACKTRACE")) {
    base.capture_backtrace = *backtrace;
  }
  if (const auto display_context = env_switch("OPEN_UNION_DISPLAY_CONTEXT")) {
    base.display_context = *display_context;
  }
  return base;
}

TraceConfig current_trace_config()
{
  const std::lock_guard<std::mutex> lock(config_mutex());
  return config_storage();
}

void set_trace_config(const TraceConfig & config)
{
  const std::lock_guard<std::mutex> lock(config_mutex());
  config_storage() = config;
}

ScopedTraceConfig::ScopedTraceConfig(const TraceConfig & config)
: previous_(current_trace_config())
{
  set_trace_config(config);
}

ScopedTraceConfig::~ScopedTraceConfig() { set_trace_config(previous_); }

}  // namespace open_union
