// top100/basic/diagnostic.cpp - Diagnostic implementation
#include "top100/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace top100
{

namespace
{

Diagnostic make_diagnostic(Severity severity, std::filesystem::path path, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.location.path = std::move(path);
  return d;
}

}  // namespace

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::at(const SourceFile & source, LineColumn position)
{
  diagnostic_.location.position = position;
  if (position.is_valid()) {
    diagnostic_.location.snippet = std::string(source.get_line(position.line - 1));
  }
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(std::filesystem::path path, std::string message)
{
  return {*this, make_diagnostic(Severity::Error, std::move(path), std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(std::filesystem::path path, std::string message)
{
  return {*this, make_diagnostic(Severity::Warning, std::move(path), std::move(message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

}  // namespace top100
