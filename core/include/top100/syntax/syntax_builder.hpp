// top100/syntax/syntax_builder.hpp - CST -> SyntaxNode lowering
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "top100/syntax/syntax_kind.hpp"
#include "top100/syntax/syntax_tree.hpp"
#include "top100/syntax/ts_ll.hpp"

namespace top100
{

/**
 * Lowers a tree-sitter-c-sharp concrete syntax tree into SyntaxNodes.
 *
 * Lowering rules:
 * - only named CST nodes are kept; comments are dropped
 * - the declaration_list body of a type declaration is flattened, so members
 *   are immediate children of the type declaration node
 * - checked_statement is split into CheckedStatement / UncheckedStatement
 * - lambda_expression is split into ParenthesizedLambdaExpression /
 *   SimpleLambdaExpression by the shape of its parameters
 * - grammar nodes without a dedicated kind become SyntaxKind::Other
 *
 * The walk keeps its own stack, so arbitrarily deep trees (long operator
 * chains, deeply nested blocks) do not grow the call stack.
 *
 * Owns no memory; every node is written into the SyntaxContext.
 */
class SyntaxBuilder
{
public:
  explicit SyntaxBuilder(SyntaxContext & ctx) : ctx_(ctx) {}

  [[nodiscard]] const SyntaxNode * build(ts_ll::Node root);

private:
  /// A CST node whose children are being lowered
  struct PendingNode
  {
    SyntaxKind kind = SyntaxKind::Other;
    uint32_t line = 0;
    std::vector<ts_ll::Node> cst_children;
    size_t next = 0;
    std::vector<const SyntaxNode *> children;
  };

  [[nodiscard]] static PendingNode open_node(ts_ll::Node n);
  static void collect_children(ts_ll::Node n, SyntaxKind kind, std::vector<ts_ll::Node> & out);

  [[nodiscard]] static SyntaxKind classify(ts_ll::Node n);
  [[nodiscard]] static SyntaxKind classify_checked(ts_ll::Node n);
  [[nodiscard]] static SyntaxKind classify_lambda(ts_ll::Node n);

  SyntaxContext & ctx_;
};

}  // namespace top100
