// top100/tools/top100/command_args.hpp - Command line argument parsing
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "top100/project/tool_config.hpp"

namespace top100
{

/**
 * Parsed command line. `error` is non-empty when the arguments are invalid;
 * parsing stops at the first problem.
 */
struct CommandArgs
{
  std::vector<std::string> positional;
  std::optional<std::string> config_path;
  std::optional<size_t> limit;
  std::optional<unsigned> jobs;
  std::optional<StatementSet> statements;
  std::optional<ReportFormat> format;
  std::vector<std::string> extensions;
  bool recursive = false;
  bool keep_error_files = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

/// Parse the arguments after the program name; no arguments means --help
[[nodiscard]] CommandArgs parse_args(const std::vector<std::string> & args);

}  // namespace top100
