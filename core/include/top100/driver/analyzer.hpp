// top100/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the directory -> ranked members pipeline.
// Used by the CLI and usable from other tools.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "top100/basic/diagnostic.hpp"
#include "top100/metrics/metric.hpp"
#include "top100/metrics/ranker.hpp"
#include "top100/metrics/statement_count.hpp"
#include "top100/syntax/ts_ll.hpp"

namespace top100
{

// ============================================================================
// Analysis Options
// ============================================================================

struct AnalysisOptions
{
  /// Accepted source file extensions (exact, case-sensitive, with the dot)
  std::vector<std::string> extensions = {".cs"};

  /// Descend into sub-directories of the root
  bool recursive = false;

  /// Statement kinds counted by Metric::StatementCount
  StatementSet statements = StatementSet::Simple;

  /// Drop files whose parse needed error recovery
  bool skip_files_with_syntax_errors = true;

  /// Worker threads (0 = std::thread::hardware_concurrency())
  unsigned jobs = 0;
};

// ============================================================================
// Analysis Result
// ============================================================================

struct AnalysisResult
{
  /// False only when the root could not be enumerated or the parser could not start
  bool success = false;

  /// Collected diagnostics (skipped files, fatal errors)
  DiagnosticBag diagnostics;

  /// Every measured member, in no particular order
  std::vector<MeasuredMember> members;

  size_t files_scanned = 0;   ///< Source files found under the root
  size_t files_analyzed = 0;  ///< Files whose members were measured
  size_t files_skipped = 0;   ///< Unreadable or rejected files

  /// Ranked view of `members` by one metric
  [[nodiscard]] std::vector<ScoredResult> ranked(Metric metric, size_t limit) const;
};

/**
 * Output of one file's analysis, produced independently on a worker thread.
 */
struct FileAnalysis
{
  bool analyzed = false;
  std::vector<MeasuredMember> members;
  DiagnosticBag diagnostics;
};

// ============================================================================
// Source enumeration
// ============================================================================

/**
 * List the source files under `root`, sorted by path.
 *
 * @return std::nullopt (with an E001 error in `diags`) if `root` is missing,
 *         not a directory, or cannot be listed
 */
[[nodiscard]] std::optional<std::vector<std::filesystem::path>> enumerate_source_files(
  const std::filesystem::path & root, const AnalysisOptions & options, DiagnosticBag & diags);

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Runs the pipeline:
 * 1. Enumerate source files
 * 2. Parse, extract and measure each file on a pool of worker threads
 * 3. Concatenate the per-worker results once every worker has finished
 *
 * A file that cannot be read or parsed is reported and skipped; the run goes on.
 */
class Analyzer
{
public:
  [[nodiscard]] static AnalysisResult analyze(
    const std::filesystem::path & root, const AnalysisOptions & options);

  /// Same as analyze() on an explicit file list
  [[nodiscard]] static AnalysisResult analyze_files(
    const std::vector<std::filesystem::path> & files, const AnalysisOptions & options);

  /// Parse one file and measure its members with the given parser
  [[nodiscard]] static FileAnalysis analyze_file(
    const ts_ll::Parser & parser, const std::filesystem::path & file,
    const AnalysisOptions & options);

  /// Measure the members of an already parsed tree
  [[nodiscard]] static std::vector<MeasuredMember> measure_members(
    const SyntaxNode & root, const std::string & file_name, StatementSet statements);

private:
  [[nodiscard]] static unsigned worker_count(const AnalysisOptions & options, size_t file_count);
};

// ============================================================================
// Ranking entry points
// ============================================================================

struct RankResult
{
  bool success = false;
  DiagnosticBag diagnostics;
  std::vector<ScoredResult> results;
};

[[nodiscard]] RankResult rank_by_statement_count(
  const std::filesystem::path & root, size_t limit = k_default_rank_limit,
  const AnalysisOptions & options = {});

[[nodiscard]] RankResult rank_by_nesting_depth(
  const std::filesystem::path & root, size_t limit = k_default_rank_limit,
  const AnalysisOptions & options = {});

}  // namespace top100
