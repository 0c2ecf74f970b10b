// declref/project/project_config.hpp - Project configuration (declref.yaml)
//
// Parses and validates declref.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "declref/basic/diagnostic.hpp"

namespace declref
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Package metadata section.
 */
struct PackageConfig
{
  /// Expected working package name; must match the API model when set
  std::optional<std::string> name;
};

/**
 * Checker configuration section.
 */
struct CheckerConfig
{
  /// Severity of unresolved references: "error" | "warning"
  Severity unresolved_severity = Severity::Error;
};

/**
 * Complete project configuration (declref.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;

  /// API model file (relative paths are resolved against project_root)
  std::filesystem::path model;

  /// Reference batch files, checked in order
  std::vector<std::filesystem::path> references;

  CheckerConfig checker;

  /// Directory containing declref.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Absolute path of a configured file
  [[nodiscard]] std::filesystem::path resolve_path(const std::filesystem::path & p) const
  {
    return p.is_absolute() ? p : project_root / p;
  }
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

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
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
 * Load a project configuration from a declref.yaml file.
 *
 * @param config_path Path to declref.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * Searches for declref.yaml starting from start_dir and moving up the
 * directory hierarchy until the filesystem root.
 *
 * @param start_dir Directory to start searching from
 * @return Path to declref.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "declref.yaml";

}  // namespace declref
