// top100/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "top100/basic/diagnostic.hpp"

namespace top100
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W001]: skipping file with syntax errors
 *     --> src/Parser.cs:42:9
 *      |
 *   42 |         if (x {
 *      |         ^
 *      |
 *      = help: pass --keep-error-files to analyze it anyway
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by file and line.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_snippet(const DiagnosticLocation & location);
  void print_help(std::string_view message);

  [[nodiscard]] std::string display_path(const DiagnosticLocation & location) const;

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace top100
