// top100/project/tool_config.hpp - Tool configuration (top100.yaml)
//
// Parses and validates top100.yaml configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "top100/driver/analyzer.hpp"
#include "top100/metrics/ranker.hpp"
#include "top100/report/report_writer.hpp"

namespace top100
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Report section.
 */
struct ReportConfig
{
  /// Results kept per metric
  size_t limit = k_default_rank_limit;

  /// Output format of both report files
  ReportFormat format = ReportFormat::Text;
};

/**
 * Complete tool configuration (top100.yaml).
 */
struct ToolConfig
{
  AnalysisOptions analysis;
  ReportConfig report;

  /// File the configuration was read from (empty for defaults)
  std::filesystem::path source_path;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ToolConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ToolConfig cfg)
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
 * Load a configuration from a top100.yaml file.
 *
 * Keys that are absent keep their defaults.
 *
 * @param config_path Path to the YAML file
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_tool_config(const std::filesystem::path & config_path);

/**
 * Parse a configuration from YAML text (same rules as load_tool_config).
 */
[[nodiscard]] ConfigLoadResult parse_tool_config(const std::string & yaml_text);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to top100.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_tool_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_tool_config_file_name = "top100.yaml";

}  // namespace top100
