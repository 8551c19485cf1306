// open_union/trace/trace_config.hpp - Trace configuration (open_union.yaml)
//
// Controls backtrace capture at union construction and whether Display
// renderings include the Context block. The process-wide configuration is
// initialised from defaults plus environment overrides, and can be replaced
// from a YAML file or programmatically.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace open_union
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct TraceConfig
{
  /// Capture a backtrace when a union is first constructed
  bool capture_backtrace = true;

  /// Upper bound on captured frames
  std::size_t max_backtrace_frames = 64;

  /// Include the Context block in Display renderings (Debug always does)
  bool display_context = false;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  TraceConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(TraceConfig cfg)
  {
    ConfigLoadResult r;
    r.config = cfg;
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a trace configuration from a YAML file.
 *
 * Recognised keys live under a top-level `trace` map: `backtrace` (bool),
 * `max_frames` (positive integer) and `display_context` (bool). Missing keys
 * keep their defaults; unknown keys are ignored.
 *
 * @param config_path Path to open_union.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_trace_config(const std::filesystem::path & config_path);

/**
 * Find a trace configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to open_union.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_trace_config(
  const std::filesystem::path & start_dir);

/**
 * Apply OPEN_UNION_BACKTRACE and OPEN_UNION_DISPLAY_CONTEXT overrides.
 *
 * "0", "false", "off" and "no" disable a setting; any other non-empty value
 * enables it. Unset variables leave the base value untouched.
 */
[[nodiscard]] TraceConfig apply_environment(TraceConfig base);

/// Snapshot of the process-wide configuration
[[nodiscard]] TraceConfig current_trace_config();

/// Replace the process-wide configuration
void set_trace_config(const TraceConfig & config);

/**
 * Installs a configuration for the lifetime of the object and restores the
 * previous one on destruction.
 */
class ScopedTraceConfig
{
public:
  explicit ScopedTraceConfig(const TraceConfig & config);
  ~ScopedTraceConfig();

  ScopedTraceConfig(const ScopedTraceConfig &) = delete;
  ScopedTraceConfig & operator=(const ScopedTraceConfig &) = delete;

private:
  TraceConfig previous_;
};

/**
 * Default name of the trace configuration file.
 */
inline constexpr const char * k_trace_config_file_name = "open_union.yaml";

}  // namespace open_union
