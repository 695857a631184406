// top100/syntax/syntax_builder.cpp - CST -> SyntaxNode lowering
#include "top100/syntax/syntax_builder.hpp"

namespace top100
{

const SyntaxNode * SyntaxBuilder::build(ts_ll::Node root)
{
  if (root.is_null()) return nullptr;

  std::vector<PendingNode> stack;
  stack.push_back(open_node(root));

  while (true) {
    PendingNode & top = stack.back();
    if (top.next < top.cst_children.size()) {
      const ts_ll::Node child = top.cst_children[top.next++];
      stack.push_back(open_node(child));
      continue;
    }

    const SyntaxNode * done = ctx_.create(top.kind, top.line, top.children);
    stack.pop_back();
    if (stack.empty()) return done;
    stack.back().children.push_back(done);
  }
}

SyntaxBuilder::PendingNode SyntaxBuilder::open_node(ts_ll::Node n)
{
  PendingNode pending;
  pending.kind = classify(n);
  pending.line = n.start_position().line;
  collect_children(n, pending.kind, pending.cst_children);
  return pending;
}

void SyntaxBuilder::collect_children(
  ts_ll::Node n, SyntaxKind kind, std::vector<ts_ll::Node> & out)
{
  ts_ll::Cursor cursor(n);
  if (!cursor.goto_first_child()) return;

  do {
    const ts_ll::Node child = cursor.current_node();
    if (!child.is_named() || child.kind() == "comment") continue;

    // Members of a class-like declaration sit directly under it.
    if (is_type_decl_kind(kind) && child.kind() == "declaration_list") {
      collect_children(child, SyntaxKind::Other, out);
      continue;
    }

    out.push_back(child);
  } while (cursor.goto_next_sibling());
}

SyntaxKind SyntaxBuilder::classify(ts_ll::Node n)
{
  if (n.is_error()) return SyntaxKind::Error;

  const std::string_view grammar_name = n.kind();
  if (grammar_name == "checked_statement") return classify_checked(n);
  if (grammar_name == "lambda_expression") return classify_lambda(n);
  return kind_from_grammar_name(grammar_name);
}

SyntaxKind SyntaxBuilder::classify_checked(ts_ll::Node n)
{
  // grammar: checked_statement = seq(choice('checked', 'unchecked'), block)
  if (n.child_count() > 0 && n.child(0).kind() == "unchecked") {
    return SyntaxKind::UncheckedStatement;
  }
  return SyntaxKind::CheckedStatement;
}

SyntaxKind SyntaxBuilder::classify_lambda(ts_ll::Node n)
{
  // `(a, b) => ...` carries a parameter_list; `a => ...` a bare identifier
  const ts_ll::Node params = n.child_by_field("parameters");
  if (!params.is_null() && params.kind() == "parameter_list") {
    return SyntaxKind::ParenthesizedLambdaExpression;
  }
  return SyntaxKind::SimpleLambdaExpression;
}

}  // namespace top100
