// spawn_dsl/project/project_config.hpp - Project configuration (spawnc.yaml)
//
// Parses and validates spawnc.yaml. The codegen and diagnostics sections
// map directly onto the options consumed by the compiler passes.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "spawn_dsl/codegen/codegen_options.hpp"
#include "spawn_dsl/sema/scope_resolver.hpp"

namespace spawn_dsl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// `.spawn` files to compile
  std::vector<std::filesystem::path> entry_points;

  /// Output directory for generated files
  std::filesystem::path output_dir = "generated";
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
 * Complete project configuration (spawnc.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;
  codegen::CodegenOptions codegen;
  ResolverOptions diagnostics;

  /// Directory containing spawnc.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

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
 * Load a project configuration from a spawnc.yaml file.
 *
 * @param config_path Path to spawnc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse a configuration from YAML text. Relative paths resolve against
 * `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find spawnc.yaml by searching upward from start_dir to the filesystem
 * root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Default name of the project configuration file.
inline constexpr const char * k_project_config_file_name = "spawnc.yaml";

}  // namespace spawn_dsl
