// java_lens/project/project_config.hpp - Project configuration (java_lens.yaml)
//
// Parses and validates java_lens.yaml project configuration files.
// Shared by the CLI and the language server.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "java_lens/analysis/analysis_options.hpp"

namespace java_lens
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (java_lens.yaml).
 *
 * @code
 *   analysis:
 *     max_parse_bytes: 1048576
 *   lifecycle:
 *     target_files: [ZygoteInit.java, SystemServer.java]
 *     methods: [main, startBootstrapServices, startCoreServices, startOtherServices]
 *   scan:
 *     exclude_dirs: [out, build, .gradle, node_modules]
 * @endcode
 */
struct ProjectConfig
{
  AnalysisOptions analysis;
  ScanOptions scan;

  /// Directory containing java_lens.yaml (empty for built-in defaults)
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
 * Load a project configuration from a java_lens.yaml file.
 *
 * Every key is optional. Missing keys keep their defaults.
 *
 * @param config_path Path to java_lens.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. `project_root` is left empty.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(const std::string & yaml_text);

/**
 * Find java_lens.yaml by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to java_lens.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "java_lens.yaml";

}  // namespace java_lens
