// top100/test_support/syntax_helpers.hpp - helpers for unit/integration tests
//
// Hand-built trees let the metrics be tested without the parser; the parse
// helpers run real C# snippets through the full front end.
//
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "top100/syntax/frontend.hpp"
#include "top100/syntax/syntax_tree.hpp"

namespace top100::test_support
{

// ============================================================================
// Hand-built trees
// ============================================================================

/**
 * Owns a SyntaxContext and offers short node constructors.
 *
 * @code
 *   TestTree t;
 *   const auto * body = t.node(SyntaxKind::Block, {t.leaf(SyntaxKind::ReturnStatement)});
 * @endcode
 */
class TestTree
{
public:
  const SyntaxNode * node(
    SyntaxKind kind, const std::vector<const SyntaxNode *> & children = {}, uint32_t line = 1)
  {
    return ctx_.create(kind, line, children);
  }

  const SyntaxNode * leaf(SyntaxKind kind, uint32_t line = 1) { return node(kind, {}, line); }

  /// `kind` wrapping a block that holds `children`
  const SyntaxNode * with_block(SyntaxKind kind, const std::vector<const SyntaxNode *> & children)
  {
    return node(kind, {leaf(SyntaxKind::Other), node(SyntaxKind::Block, children)});
  }

  /// `depth` levels of `kind { ... }` around `innermost`
  const SyntaxNode * nested(SyntaxKind kind, size_t depth, const SyntaxNode * innermost)
  {
    const SyntaxNode * current = innermost;
    for (size_t i = 0; i < depth; ++i) {
      current = with_block(kind, {current});
    }
    return current;
  }

  /// Method declaration at `line` whose body block holds `body`
  const SyntaxNode * method(const std::vector<const SyntaxNode *> & body, uint32_t line = 1)
  {
    return node(
      SyntaxKind::MethodDeclaration,
      {leaf(SyntaxKind::Other, line), node(SyntaxKind::Block, body, line)}, line);
  }

private:
  SyntaxContext ctx_;
};

// ============================================================================
// Parsing
// ============================================================================

[[nodiscard]] inline std::unique_ptr<ParsedUnit> parse(
  std::string src, std::filesystem::path virtual_path = "Test.cs")
{
  return parse_source(std::move(virtual_path), std::move(src));
}

/// First node of `kind` in pre-order, or nullptr
[[nodiscard]] inline const SyntaxNode * find_first(const SyntaxNode & root, SyntaxKind kind)
{
  std::vector<const SyntaxNode *> pending{&root};
  while (!pending.empty()) {
    const SyntaxNode * current = pending.back();
    pending.pop_back();
    if (current->kind() == kind) return current;
    const auto children = current->children();
    pending.insert(pending.end(), children.rbegin(), children.rend());
  }
  return nullptr;
}

/// Number of nodes of `kind` in the subtree
[[nodiscard]] inline size_t count_kind(const SyntaxNode & root, SyntaxKind kind)
{
  size_t n = 0;
  std::vector<const SyntaxNode *> pending{&root};
  while (!pending.empty()) {
    const SyntaxNode * current = pending.back();
    pending.pop_back();
    if (current->kind() == kind) ++n;
    const auto children = current->children();
    pending.insert(pending.end(), children.begin(), children.end());
  }
  return n;
}

/// `int s = 0; s = p0 + p1 + ... + p<terms - 1>;` inside `class Deep { void M() { ... } }`
[[nodiscard]] inline std::string deep_expression_source(size_t terms)
{
  std::string src = "class Deep\n{\n    void M()\n    {\n        int s = 0;\n        s = p0";
  for (size_t i = 1; i < terms; ++i) {
    src += " + p" + std::to_string(i);
  }
  src += ";\n    }\n}\n";
  return src;
}

// ============================================================================
// Filesystem
// ============================================================================

/**
 * Fresh directory under the system temp directory, removed on destruction.
 */
class TempDir
{
public:
  TempDir()
  {
    static std::atomic<unsigned> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("top100_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Write `content` to `relative` below the directory, creating parents
  std::filesystem::path write(const std::filesystem::path & relative, const std::string & content)
  {
    const auto full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary);
    if (!out.is_open()) {
      throw std::runtime_error("failed to write file: " + full.string());
    }
    out << content;
    return full;
  }

private:
  std::filesystem::path path_;
};

[[nodiscard]] inline std::string read_text(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open file: " + p.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace top100::test_support
