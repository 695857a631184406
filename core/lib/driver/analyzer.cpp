// top100/driver/analyzer.cpp - Analysis driver implementation
//
#include "top100/driver/analyzer.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <future>
#include <iterator>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "top100/metrics/function_extractor.hpp"
#include "top100/syntax/frontend.hpp"

namespace top100
{

namespace
{

namespace fs = std::filesystem;

/// Text from the last '.' of the file name. Unlike path::extension(), a name
/// that is only an extension (".cs") keeps it; a trailing '.' gives none.
std::string extension_of(const fs::path & file)
{
  const std::string name = file.filename().string();
  const size_t dot = name.rfind('.');
  if (dot == std::string::npos || dot + 1 == name.size()) return {};
  return name.substr(dot);
}

bool has_accepted_extension(const fs::path & file, const AnalysisOptions & options)
{
  const std::string ext = extension_of(file);
  return std::find(options.extensions.begin(), options.extensions.end(), ext) !=
         options.extensions.end();
}

template <typename Iterator>
bool collect_files(
  Iterator it, const AnalysisOptions & options, std::vector<fs::path> & out, std::error_code & ec)
{
  for (const Iterator end; it != end; it.increment(ec)) {
    if (ec) return false;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) continue;
    if (has_accepted_extension(it->path(), options)) {
      out.push_back(it->path());
    }
  }
  return !ec;
}

/// Work assigned to one thread: files i, i + stride, i + 2 * stride, ...
struct WorkerOutput
{
  std::vector<MeasuredMember> members;
  DiagnosticBag diagnostics;
  size_t analyzed = 0;
  size_t skipped = 0;
};

WorkerOutput run_worker(
  const std::vector<fs::path> & files, size_t first, size_t stride,
  const AnalysisOptions & options)
{
  WorkerOutput out;
  const ts_ll::Parser parser;
  for (size_t i = first; i < files.size(); i += stride) {
    FileAnalysis file = Analyzer::analyze_file(parser, files[i], options);
    if (file.analyzed) {
      ++out.analyzed;
      out.members.insert(
        out.members.end(), std::make_move_iterator(file.members.begin()),
        std::make_move_iterator(file.members.end()));
    } else {
      ++out.skipped;
    }
    out.diagnostics.merge(std::move(file.diagnostics));
  }
  return out;
}

}  // namespace

// ============================================================================
// AnalysisResult
// ============================================================================

std::vector<ScoredResult> AnalysisResult::ranked(Metric metric, size_t limit) const
{
  std::vector<ScoredResult> scored;
  scored.reserve(members.size());
  for (const auto & m : members) {
    scored.push_back(make_result(m, metric));
  }
  return rank(std::move(scored), limit);
}

// ============================================================================
// Source enumeration
// ============================================================================

std::optional<std::vector<fs::path>> enumerate_source_files(
  const fs::path & root, const AnalysisOptions & options, DiagnosticBag & diags)
{
  std::error_code ec;
  if (!fs::exists(root, ec) || ec) {
    diags.report_error(root, "source directory not found")
      .with_code(diag_codes::k_root_not_found);
    return std::nullopt;
  }
  if (!fs::is_directory(root, ec) || ec) {
    diags.report_error(root, "source path is not a directory")
      .with_code(diag_codes::k_root_not_found);
    return std::nullopt;
  }

  std::vector<fs::path> files;
  bool listed = false;
  if (options.recursive) {
    listed = collect_files(
      fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec),
      options, files, ec);
  } else {
    listed = collect_files(fs::directory_iterator(root, ec), options, files, ec);
  }

  if (!listed || ec) {
    diags.report_error(root, "cannot list source directory: " + ec.message())
      .with_code(diag_codes::k_root_not_found);
    return std::nullopt;
  }

  std::sort(files.begin(), files.end());
  return files;
}

// ============================================================================
// Analyzer
// ============================================================================

AnalysisResult Analyzer::analyze(const fs::path & root, const AnalysisOptions & options)
{
  AnalysisResult result;
  auto files = enumerate_source_files(root, options, result.diagnostics);
  if (!files) {
    return result;
  }

  return analyze_files(*files, options);
}

AnalysisResult Analyzer::analyze_files(
  const std::vector<fs::path> & files, const AnalysisOptions & options)
{
  AnalysisResult result;
  result.files_scanned = files.size();

  const unsigned workers = worker_count(options, files.size());

  std::vector<std::future<WorkerOutput>> pending;
  pending.reserve(workers);
  for (unsigned w = 0; w < workers; ++w) {
    pending.push_back(std::async(
      std::launch::async, run_worker, std::cref(files), static_cast<size_t>(w),
      static_cast<size_t>(workers), std::cref(options)));
  }

  // Join every worker before touching the combined result.
  bool worker_failed = false;
  for (auto & f : pending) {
    try {
      WorkerOutput out = f.get();
      result.files_analyzed += out.analyzed;
      result.files_skipped += out.skipped;
      result.members.insert(
        result.members.end(), std::make_move_iterator(out.members.begin()),
        std::make_move_iterator(out.members.end()));
      result.diagnostics.merge(std::move(out.diagnostics));
    } catch (const std::exception & e) {
      if (!worker_failed) {
        result.diagnostics.report_error({}, e.what());
      }
      worker_failed = true;
    }
  }

  result.success = !worker_failed;
  return result;
}

FileAnalysis Analyzer::analyze_file(
  const ts_ll::Parser & parser, const fs::path & file, const AnalysisOptions & options)
{
  FileAnalysis out;

  const auto unit = parse_file(parser, file, out.diagnostics);
  if (!unit) {
    return out;
  }

  if (unit->root == nullptr) {
    out.diagnostics.report_warning(file, "parser produced no syntax tree; skipped")
      .with_code(diag_codes::k_parser_no_tree);
    return out;
  }

  if (unit->has_syntax_errors() && options.skip_files_with_syntax_errors) {
    const Diagnostic & first = unit->diags.all().front();
    out.diagnostics
      .report_warning(
        file, "skipping file with " + std::to_string(unit->syntax_error_count) +
                " syntax error(s), first: " + first.message)
      .with_code(diag_codes::k_file_has_syntax_errors)
      .at(unit->source, first.location.position)
      .with_help("pass --keep-error-files to analyze it anyway");
    return out;
  }

  // Measured anyway; keep the recovery points visible as warnings
  for (const Diagnostic & d : unit->diags) {
    Diagnostic recovered = d;
    recovered.severity = Severity::Warning;
    recovered.code = diag_codes::k_file_recovered_syntax_errors;
    out.diagnostics.add(std::move(recovered));
  }

  out.members = measure_members(*unit->root, unit->source.file_name(), options.statements);
  out.analyzed = true;
  return out;
}

std::vector<MeasuredMember> Analyzer::measure_members(
  const SyntaxNode & root, const std::string & file_name, StatementSet statements)
{
  std::vector<MeasuredMember> measured;
  for (const MemberCandidate & member : extract_members(root, file_name)) {
    MeasuredMember m;
    m.file = member.file_name;
    m.line = member.line();
    m.statements = measure(Metric::StatementCount, *member.node, statements);
    m.nesting = measure(Metric::NestingDepth, *member.node);
    measured.push_back(std::move(m));
  }
  return measured;
}

unsigned Analyzer::worker_count(const AnalysisOptions & options, size_t file_count)
{
  if (file_count == 0) return 0;
  unsigned jobs = options.jobs;
  if (jobs == 0) {
    jobs = std::max(1U, std::thread::hardware_concurrency());
  }
  return static_cast<unsigned>(std::min<size_t>(jobs, file_count));
}

// ============================================================================
// Ranking entry points
// ============================================================================

namespace
{

RankResult rank_by(
  Metric metric, const fs::path & root, size_t limit, const AnalysisOptions & options)
{
  AnalysisResult analysis = Analyzer::analyze(root, options);

  RankResult out;
  out.success = analysis.success;
  out.results = analysis.ranked(metric, limit);
  out.diagnostics = std::move(analysis.diagnostics);
  return out;
}

}  // namespace

RankResult rank_by_statement_count(
  const fs::path & root, size_t limit, const AnalysisOptions & options)
{
  return rank_by(Metric::StatementCount, root, limit, options);
}

RankResult rank_by_nesting_depth(
  const fs::path & root, size_t limit, const AnalysisOptions & options)
{
  return rank_by(Metric::NestingDepth, root, limit, options);
}

}  // namespace top100
