// top100/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "top100/basic/diagnostic.hpp"
#include "top100/basic/source_manager.hpp"
#include "top100/syntax/syntax_tree.hpp"
#include "top100/syntax/ts_ll.hpp"

namespace top100
{

/**
 * Everything produced by parsing one file.
 *
 * The unit owns the source text and the node arena; `root` is valid for the
 * unit's lifetime.
 */
struct ParsedUnit
{
  SourceFile source;
  std::unique_ptr<SyntaxContext> syntax = std::make_unique<SyntaxContext>();
  const SyntaxNode * root = nullptr;

  /// Syntax errors recovered by the parser (ERROR / MISSING nodes)
  DiagnosticBag diags;
  size_t syntax_error_count = 0;

  [[nodiscard]] bool has_syntax_errors() const noexcept { return syntax_error_count > 0; }
};

// Parse pipeline:
// source -> tree-sitter-c-sharp (CST) -> SyntaxBuilder (SyntaxNode tree) -> diagnostics
//
// `root` is null only if tree-sitter returned no tree at all.
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  const ts_ll::Parser & parser, std::filesystem::path path, std::string source_text);

/// Convenience overload that creates a one-shot parser.
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::filesystem::path path, std::string source_text);

/**
 * Read and parse a file.
 *
 * @return nullptr if the file cannot be read; a W002 warning is added to `diags`
 */
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_file(
  const ts_ll::Parser & parser, const std::filesystem::path & path, DiagnosticBag & diags);

}  // namespace top100
