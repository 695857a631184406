// top100/metrics/nesting_depth.hpp - Maximum control-flow nesting depth
#pragma once

#include <array>
#include <cstdint>

#include "top100/syntax/syntax_kind.hpp"
#include "top100/syntax/syntax_tree.hpp"

namespace top100
{

/// Kinds that open one more level of nesting when entered.
inline constexpr std::array<SyntaxKind, 14> k_nesting_enlarger_kinds = {
  SyntaxKind::AnonymousMethodExpression,
  SyntaxKind::CheckedStatement,
  SyntaxKind::DoStatement,
  SyntaxKind::FixedStatement,
  SyntaxKind::ForStatement,
  SyntaxKind::ForEachStatement,
  SyntaxKind::IfStatement,
  SyntaxKind::LockStatement,
  SyntaxKind::ParenthesizedLambdaExpression,
  SyntaxKind::SwitchStatement,
  SyntaxKind::TryStatement,
  SyntaxKind::UnsafeStatement,
  SyntaxKind::UncheckedStatement,
  SyntaxKind::WhileStatement,
};

[[nodiscard]] constexpr bool is_nesting_enlarger(SyntaxKind kind) noexcept
{
  for (const SyntaxKind k : k_nesting_enlarger_kinds) {
    if (k == kind) return true;
  }
  return false;
}

/**
 * Longest chain of nested enlarging constructs below `node`.
 *
 *   depth(leaf) = 0
 *   depth(n)    = max over children c of depth(c) + (c is an enlarger ? 1 : 0)
 *
 * The node's own kind does not count; ten sibling `if`s under a body score 1.
 */
[[nodiscard]] uint32_t nesting_depth(const SyntaxNode & node);

}  // namespace top100
