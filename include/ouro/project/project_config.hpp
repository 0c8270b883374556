// ouro/project/project_config.hpp - Project configuration (ouro.yaml)
//
// Parses and validates ouro.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ouro
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Entry point files to compile (relative to the project root)
  std::vector<std::filesystem::path> entry_points;

  /// Output directory for build artifacts
  std::filesystem::path output_dir = "build";

  /// Run the optimizer after checking
  bool optimize = false;

  /// Maximum units compiled concurrently; unset means hardware concurrency
  std::optional<unsigned> jobs;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (ouro.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;

  /// Directory containing ouro.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Entry points resolved against project_root.
  [[nodiscard]] std::vector<std::filesystem::path> entry_point_paths() const;

  /// Output directory resolved against project_root.
  [[nodiscard]] std::filesystem::path output_path() const;
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
 * Load a project configuration from an ouro.yaml file.
 *
 * @param config_path Path to ouro.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse ouro.yaml text.
 *
 * @param project_root Directory relative paths in the text are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to ouro.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// ouro.yaml text for a fresh project with one entry point, src/main.ouro.
[[nodiscard]] std::string default_project_config(std::string_view project_name);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "ouro.yaml";

}  // namespace ouro
