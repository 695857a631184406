// top100 - Source complexity ranking command line interface
//
// Usage:
//   top100 <source-dir> <statements-out> <nesting-out> [options]
//
#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "command_args.hpp"
#include "top100/basic/diagnostic_printer.hpp"
#include "top100/driver/analyzer.hpp"
#include "top100/metrics/metric.hpp"
#include "top100/project/tool_config.hpp"
#include "top100/report/report_writer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "top100 v0.1.0 - rank C# members by statement count and nesting depth\n\n"
            << "Usage: " << program_name
            << " <source-dir> <statements-out> <nesting-out> [options]\n\n"
            << "Options:\n"
            << "  -n, --limit <N>          Results per metric (default 100)\n"
            << "  -j, --jobs <N>           Worker threads (0 = one per core)\n"
            << "  -r, --recursive          Descend into sub-directories\n"
            << "  --ext <.ext>             Accepted extension (repeatable, default .cs)\n"
            << "  --statements <set>       Counted statements: simple | all\n"
            << "  --format <fmt>           Report format: text | json\n"
            << "  --keep-error-files       Analyze files with recoverable syntax errors\n"
            << "  --config <path>          Load options from a YAML file\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const top100::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  top100::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Configuration
// ============================================================================

/// Defaults, then the YAML file, then command line flags
std::optional<top100::ToolConfig> resolve_config(
  const top100::CommandArgs & args, const fs::path & root)
{
  top100::ToolConfig config;

  std::optional<fs::path> config_path;
  if (args.config_path) {
    config_path = fs::path(*args.config_path);
  } else {
    std::error_code ec;
    if (fs::is_directory(root, ec)) {
      config_path = top100::find_tool_config(root);
    }
  }

  if (config_path) {
    const auto loaded = top100::load_tool_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error[" << top100::diag_codes::k_invalid_config << "]: " << loaded.error
                << "\n";
      return std::nullopt;
    }
    config = loaded.config;
    if (args.verbose) {
      std::cerr << "Using configuration: " << config.source_path.string() << "\n";
    }
  }

  if (args.limit) config.report.limit = *args.limit;
  if (args.format) config.report.format = *args.format;
  if (args.jobs) config.analysis.jobs = *args.jobs;
  if (args.statements) config.analysis.statements = *args.statements;
  if (!args.extensions.empty()) config.analysis.extensions = args.extensions;
  if (args.recursive) config.analysis.recursive = true;
  if (args.keep_error_files) config.analysis.skip_files_with_syntax_errors = false;

  return config;
}

// ============================================================================
// Command
// ============================================================================

int run(const top100::CommandArgs & args)
{
  const fs::path root = args.positional[0];
  const fs::path statements_out = args.positional[1];
  const fs::path nesting_out = args.positional[2];

  const auto config = resolve_config(args, root);
  if (!config) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Analyzing: " << root.string() << "\n";
  }

  top100::AnalysisResult result = top100::Analyzer::analyze(root, config->analysis);

  if (!result.success) {
    print_diagnostics(result.diagnostics);
    return 1;
  }

  const auto by_statements =
    result.ranked(top100::Metric::StatementCount, config->report.limit);
  const auto by_nesting = result.ranked(top100::Metric::NestingDepth, config->report.limit);

  bool written = top100::write_report(
    statements_out, by_statements, config->report.format, result.diagnostics);
  written =
    top100::write_report(nesting_out, by_nesting, config->report.format, result.diagnostics) &&
    written;

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (args.verbose) {
    std::cerr << "Files: " << result.files_scanned << " scanned, " << result.files_analyzed
              << " analyzed, " << result.files_skipped << " skipped\n"
              << "Members: " << result.members.size() << "\n";
    if (written) {
      std::cerr << "Generated: " << statements_out.string() << "\n"
                << "Generated: " << nesting_out.string() << "\n";
    }
  }

  return written ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const char * program_name = argc > 0 ? argv[0] : "top100";
  const top100::CommandArgs args =
    top100::parse_args(std::vector<std::string>(argv + std::min(argc, 1), argv + argc));

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n\n";
    print_usage(program_name);
    return 1;
  }

  if (args.show_help) {
    print_usage(program_name);
    return 0;
  }

  if (args.positional.size() != 3) {
    std::cerr << "error: expected <source-dir> <statements-out> <nesting-out>\n\n";
    print_usage(program_name);
    return 1;
  }

  try {
    return run(args);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
