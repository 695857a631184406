// top100/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "top100/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace top100
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: warning[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  const auto & loc = diag.location;
  if (!loc.path.empty()) {
    if (loc.position.is_valid()) {
      fmt::print(
        os_, "{} {}:{}:{}\n", gutter_arrow(), display_path(loc), loc.position.line,
        loc.position.column);
    } else {
      fmt::print(os_, "{} {}\n", gutter_arrow(), display_path(loc));
    }
  }

  // === Source snippet ===
  if (loc.position.is_valid() && !loc.snippet.empty()) {
    print_snippet(loc);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  // Worker threads report in any order; print by file then line (stable).
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      if (a.location.path != b.location.path) return a.location.path < b.location.path;
      return a.location.position.line < b.location.position.line;
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  std::string severity_str;
  switch (diag.severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
  }

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_snippet(const DiagnosticLocation & location)
{
  // Build cleaned line (tabs -> spaces) and the marker offset alongside it
  std::string cleaned_line;
  std::string marker_prefix;
  cleaned_line.reserve(location.snippet.size());
  uint32_t col = 1;
  for (const char c : location.snippet) {
    const bool before_marker = col < location.position.column;
    if (c == '\t') {
      cleaned_line += "    ";
      if (before_marker) marker_prefix += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
      if (before_marker) marker_prefix += ' ';
    }
    ++col;
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", location.position.line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", location.position.line);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "{} {}", gutter_pipe(), marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold << "^" << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "^");
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

std::string DiagnosticPrinter::display_path(const DiagnosticLocation & location) const
{
  // Convert to relative path for cleaner output
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return location.path.string();
  }
  const auto rel_path = std::filesystem::relative(location.path, cwd, ec);
  if (ec || rel_path.empty()) {
    return location.path.string();
  }
  return rel_path.string();
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace top100
