// top100/basic/diagnostic.hpp - Diagnostic types for parsing and analysis
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "top100/basic/source_manager.hpp"

namespace top100
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * Where a diagnostic points to.
 *
 * `position` is invalid for whole-file or path-level problems.
 * `snippet` holds the source line at `position`, captured when the
 * diagnostic is reported, because the file's text is released once the
 * file has been analyzed.
 */
struct DiagnosticLocation
{
  std::filesystem::path path;
  LineColumn position;
  std::string snippet;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "W001"
  std::string message;  // main message

  DiagnosticLocation location;
  std::optional<std::string> help_message;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  /// Point at a line/column of `source` and capture that line as the snippet
  DiagnosticBuilder & at(const SourceFile & source, LineColumn position);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(std::filesystem::path path, std::string message);
  DiagnosticBuilder report_warning(std::filesystem::path path, std::string message);

  // Add
  void add(Diagnostic && diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;

  // Utilities
  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

// ============================================================================
// Diagnostic codes
// ============================================================================

namespace diag_codes
{
inline constexpr const char * k_file_has_syntax_errors = "W001";
inline constexpr const char * k_file_unreadable = "W002";
inline constexpr const char * k_parser_no_tree = "W003";
inline constexpr const char * k_file_recovered_syntax_errors = "W004";
inline constexpr const char * k_root_not_found = "E001";
inline constexpr const char * k_output_not_writable = "E002";
inline constexpr const char * k_invalid_config = "E003";
}  // namespace diag_codes

}  // namespace top100
