// top100/report/report_writer.cpp - Ranked result output
//
#include "top100/report/report_writer.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace top100
{

namespace
{

using nlohmann::json;

json j_result(const ScoredResult & r)
{
  return json{{"value", r.value}, {"file", r.file}, {"line", r.line}};
}

std::string render_text(const std::vector<ScoredResult> & results)
{
  std::string out;
  for (const auto & r : results) {
    out += format_result(r);
    out += '\n';
  }
  return out;
}

std::string render_json(const std::vector<ScoredResult> & results)
{
  json arr = json::array();
  for (const auto & r : results) {
    arr.push_back(j_result(r));
  }
  return arr.dump(2) + "\n";
}

}  // namespace

std::optional<ReportFormat> parse_report_format(std::string_view name) noexcept
{
  if (name == "text") return ReportFormat::Text;
  if (name == "json") return ReportFormat::Json;
  return std::nullopt;
}

std::string render_report(const std::vector<ScoredResult> & results, ReportFormat format)
{
  switch (format) {
    case ReportFormat::Text:
      return render_text(results);
    case ReportFormat::Json:
      return render_json(results);
  }
  return {};
}

bool write_report(
  const std::filesystem::path & path, const std::vector<ScoredResult> & results,
  ReportFormat format, DiagnosticBag & diags)
{
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      diags.report_error(path, "cannot create output directory: " + ec.message())
        .with_code(diag_codes::k_output_not_writable);
      return false;
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    diags.report_error(path, "cannot open output file for writing")
      .with_code(diag_codes::k_output_not_writable);
    return false;
  }

  out << render_report(results, format);
  out.flush();
  if (!out) {
    diags.report_error(path, "failed to write output file")
      .with_code(diag_codes::k_output_not_writable);
    return false;
  }
  return true;
}

}  // namespace top100
