// wfgraph/project/project_config.hpp - Project configuration (wfgraph.yaml)
//
// Parses and validates wfgraph.yaml project configuration files.
// Relative paths are resolved against the directory holding the file.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace wfgraph
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Tracer configuration section.
 */
struct TracerConfig
{
  /// Worker threads for dry runs (0 = hardware concurrency)
  unsigned jobs = 0;

  /// Root of the synthetic paths handed to scripts during dry runs
  std::filesystem::path dry_run_root = "dry-run";
};

/**
 * Output configuration section.
 */
struct OutputConfig
{
  /// Directory receiving rendered graphs and the trace file
  std::filesystem::path dir = "docs/graphs";
};

/**
 * Project metadata section.
 */
struct ProjectInfo
{
  std::string name;
};

/**
 * Complete project configuration (wfgraph.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;

  /// Catalog file; the installed default catalog is used when unset
  std::optional<std::filesystem::path> catalog;

  /// Scenario folder for `wfgraph locate`
  std::optional<std::filesystem::path> scenario;

  TracerConfig tracer;
  OutputConfig output;

  /// Directory containing wfgraph.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
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
 * Load a project configuration from a wfgraph.yaml file.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to wfgraph.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "wfgraph.yaml";

}  // namespace wfgraph
