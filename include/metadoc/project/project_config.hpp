// metadoc/project/project_config.hpp - Project configuration (metadoc.yaml)
//
// Parses and validates metadoc.yaml project configuration files.
// Command-line options are layered on top by the CLI.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace metadoc
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (metadoc.yaml).
 *
 * Example:
 *   target: ./site
 *   classpath:
 *     - ./core/target/classes
 *     - ./cli/target/classes
 *   zip: false
 *   clean_target_first: true
 *   threads: 0
 */
struct ProjectConfig
{
  /// Output directory of the generated site
  std::optional<std::filesystem::path> target;

  /// Classpath roots scanned for semantic metadata
  std::vector<std::filesystem::path> classpath;

  /// Write the site into <target>/metadoc.zip instead of a directory tree
  bool zip = false;

  /// Remove the target directory before writing
  bool clean_target_first = false;

  /// Disable the in-place progress bar
  bool non_interactive = false;

  /// Worker threads (0 = one per core)
  unsigned threads = 0;

  /// Directory containing metadoc.yaml (for resolving relative paths)
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
 * Load a project configuration from a metadoc.yaml file.
 *
 * Relative target and classpath entries are resolved against the directory
 * containing the file.
 *
 * @param config_path Path to metadoc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to metadoc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "metadoc.yaml";

}  // namespace metadoc
