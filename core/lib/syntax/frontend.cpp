// top100/syntax/frontend.cpp - High-level parse pipeline
#include "top100/syntax/frontend.hpp"

#include <string>
#include <utility>
#include <vector>

#include "top100/syntax/syntax_builder.hpp"

namespace top100
{

namespace
{

void collect_syntax_diagnostics(const ts_ll::Node root, ParsedUnit & unit)
{
  constexpr size_t max_syntax_diags = 64;

  // Pre-order walk; children are pushed last-first so errors come out in
  // document order.
  std::vector<ts_ll::Node> pending{root};
  while (!pending.empty() && unit.syntax_error_count < max_syntax_diags) {
    const ts_ll::Node n = pending.back();
    pending.pop_back();
    if (n.is_null()) continue;

    if (n.is_error()) {
      unit.diags.report_error(unit.source.path(), "syntax error")
        .at(unit.source, n.start_position());
      ++unit.syntax_error_count;
    } else if (n.is_missing()) {
      unit.diags.report_error(unit.source.path(), "missing '" + std::string(n.kind()) + "'")
        .at(unit.source, n.start_position());
      ++unit.syntax_error_count;
    }

    for (uint32_t i = n.child_count(); i > 0; --i) {
      pending.push_back(n.child(i - 1));
    }
  }
}

}  // namespace

std::unique_ptr<ParsedUnit> parse_source(
  const ts_ll::Parser & parser, std::filesystem::path path, std::string source_text)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceFile(std::move(path), std::move(source_text));

  const ts_ll::Tree tree = parser.parse(unit->source.content());
  if (tree.is_null()) {
    return unit;
  }

  const ts_ll::Node root = tree.root_node();

  // Tree-sitter recovers from syntax errors and still returns a tree;
  // recovery points are surfaced as diagnostics.
  if (root.has_error()) {
    collect_syntax_diagnostics(root, *unit);
  }

  SyntaxBuilder builder(*unit->syntax);
  unit->root = builder.build(root);
  return unit;
}

std::unique_ptr<ParsedUnit> parse_source(std::filesystem::path path, std::string source_text)
{
  const ts_ll::Parser parser;
  return parse_source(parser, std::move(path), std::move(source_text));
}

std::unique_ptr<ParsedUnit> parse_file(
  const ts_ll::Parser & parser, const std::filesystem::path & path, DiagnosticBag & diags)
{
  auto content = read_file_content(path);
  if (!content) {
    diags.report_warning(path, "cannot read file; skipped")
      .with_code(diag_codes::k_file_unreadable);
    return nullptr;
  }
  return parse_source(parser, path, std::move(*content));
}

}  // namespace top100
