// top100/metrics/function_extractor.hpp - Selection of function-like members
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "top100/syntax/syntax_tree.hpp"

namespace top100
{

/**
 * A member that contains executable code.
 *
 * `node` points into the file's SyntaxContext; `file_name` is the base name of
 * the file the member was found in.
 */
struct MemberCandidate
{
  const SyntaxNode * node = nullptr;
  std::string file_name;

  /// 1-based line of the member's first token
  [[nodiscard]] uint32_t line() const noexcept { return node ? node->line() : 0; }
};

/**
 * Check whether any node strictly below `node` is a statement other than a block.
 */
[[nodiscard]] bool has_executable_statement(const SyntaxNode & node);

/**
 * Collect the function-like members of a file.
 *
 * A member qualifies when it is an immediate child of a class, struct or
 * record declaration (interfaces excluded) and has an executable statement
 * somewhere below it. This admits methods, constructors, accessors with
 * bodies and the like, and leaves out fields, expression-bodied members and
 * abstract declarations. Nested type declarations anywhere in the tree are
 * visited too.
 *
 * Members are returned in document order.
 */
[[nodiscard]] std::vector<MemberCandidate> extract_members(
  const SyntaxNode & root, std::string_view file_name);

}  // namespace top100
