// top100/metrics/statement_count.hpp - Statement count metric
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "top100/syntax/syntax_kind.hpp"
#include "top100/syntax/syntax_tree.hpp"

namespace top100
{

/**
 * Which statement kinds the statement count includes.
 */
enum class StatementSet : uint8_t {
  Simple,  ///< Only statements that own no embedded statement (expression, return, ...)
  All,     ///< Every statement kind except block
};

[[nodiscard]] constexpr std::string_view to_string(StatementSet set) noexcept
{
  switch (set) {
    case StatementSet::Simple:
      return "simple";
    case StatementSet::All:
      return "all";
  }
  return "";
}

[[nodiscard]] std::optional<StatementSet> parse_statement_set(std::string_view name) noexcept;

/// Check whether a node of `kind` is counted under `set`
[[nodiscard]] constexpr bool counts_as_statement(SyntaxKind kind, StatementSet set) noexcept
{
  if (set == StatementSet::Simple) return is_simple_stmt_kind(kind);
  return is_executable_stmt_kind(kind);
}

/**
 * Number of counted statements in the subtree rooted at `node` (the node
 * itself included).
 *
 * Blocks are never counted. Every node is explored, counted or not, so
 * statements nested at any depth count exactly once.
 */
[[nodiscard]] uint32_t statement_count(
  const SyntaxNode & node, StatementSet set = StatementSet::Simple);

}  // namespace top100
