// top100/project/tool_config.cpp - Tool configuration implementation
//
#include "top100/project/tool_config.hpp"

#include <yaml-cpp/yaml.h>

#include <system_error>

namespace top100
{

namespace
{

/// Parse the 'analysis' section into `options`
bool parse_analysis(const YAML::Node & node, AnalysisOptions & options, std::string & error)
{
  if (!node.IsMap()) {
    error = "analysis must be a map";
    return false;
  }

  if (node["extensions"]) {
    if (!node["extensions"].IsSequence()) {
      error = "analysis.extensions must be a list";
      return false;
    }
    options.extensions.clear();
    for (const auto & ext : node["extensions"]) {
      auto value = ext.as<std::string>();
      if (value.empty()) {
        error = "analysis.extensions must not contain empty entries";
        return false;
      }
      if (value.front() != '.') {
        value.insert(value.begin(), '.');
      }
      options.extensions.push_back(std::move(value));
    }
  }

  if (node["recursive"]) {
    options.recursive = node["recursive"].as<bool>();
  }

  if (node["statements"]) {
    const auto name = node["statements"].as<std::string>();
    const auto set = parse_statement_set(name);
    if (!set) {
      error = "invalid analysis.statements: '" + name + "' (must be 'simple' or 'all')";
      return false;
    }
    options.statements = *set;
  }

  if (node["skip_files_with_syntax_errors"]) {
    options.skip_files_with_syntax_errors = node["skip_files_with_syntax_errors"].as<bool>();
  }

  if (node["jobs"]) {
    options.jobs = node["jobs"].as<unsigned>();
  }

  return true;
}

/// Parse the 'report' section into `report`
bool parse_report(const YAML::Node & node, ReportConfig & report, std::string & error)
{
  if (!node.IsMap()) {
    error = "report must be a map";
    return false;
  }

  if (node["limit"]) {
    report.limit = node["limit"].as<size_t>();
  }

  if (node["format"]) {
    const auto name = node["format"].as<std::string>();
    const auto format = parse_report_format(name);
    if (!format) {
      error = "invalid report.format: '" + name + "' (must be 'text' or 'json')";
      return false;
    }
    report.format = *format;
  }

  return true;
}

ConfigLoadResult build_config(const YAML::Node & root)
{
  ToolConfig config;
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Scalars of the wrong type surface as YAML::BadConversion from as<T>().
  try {
    std::string error;
    if (root["analysis"] && !parse_analysis(root["analysis"], config.analysis, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (root["report"] && !parse_report(root["report"], config.report, error)) {
      return ConfigLoadResult::fail(error);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_tool_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec) || ec) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }
  if (!fs::is_regular_file(config_path, ec) || ec) {
    return ConfigLoadResult::fail("configuration path is not a file: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  auto result = build_config(root);
  if (result.success) {
    const fs::path absolute = fs::absolute(config_path, ec);
    result.config.source_path = ec ? config_path : absolute;
  }
  return result;
}

ConfigLoadResult parse_tool_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return build_config(root);
}

std::optional<std::filesystem::path> find_tool_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_tool_config_file_name;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace top100
