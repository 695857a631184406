// top100/report/report_writer.hpp - Ranked result output
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "top100/basic/diagnostic.hpp"
#include "top100/metrics/ranker.hpp"

namespace top100
{

enum class ReportFormat : uint8_t {
  Text,  ///< "<value>\t<file>:<line>" per line
  Json,  ///< Array of {"value", "file", "line"} objects
};

[[nodiscard]] constexpr std::string_view to_string(ReportFormat format) noexcept
{
  switch (format) {
    case ReportFormat::Text:
      return "text";
    case ReportFormat::Json:
      return "json";
  }
  return "";
}

[[nodiscard]] std::optional<ReportFormat> parse_report_format(std::string_view name) noexcept;

/**
 * Render ranked results.
 *
 * Text output has one line per result, each ending in '\n', with no header
 * or trailer; an empty list renders as an empty string.
 */
[[nodiscard]] std::string render_report(
  const std::vector<ScoredResult> & results, ReportFormat format);

/**
 * Write ranked results to `path`, creating parent directories.
 *
 * @return false (with an E002 error in `diags`) if the file cannot be written
 */
bool write_report(
  const std::filesystem::path & path, const std::vector<ScoredResult> & results,
  ReportFormat format, DiagnosticBag & diags);

}  // namespace top100
