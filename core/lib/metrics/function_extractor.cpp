// top100/metrics/function_extractor.cpp - Selection of function-like members
#include "top100/metrics/function_extractor.hpp"

#include <vector>

#include "top100/syntax/syntax_kind.hpp"

namespace top100
{

namespace
{

bool is_member_container(SyntaxKind kind) noexcept
{
  return is_type_decl_kind(kind) && kind != SyntaxKind::InterfaceDeclaration;
}

struct PendingChild
{
  const SyntaxNode * node;
  bool in_member_container;
};

}  // namespace

bool has_executable_statement(const SyntaxNode & node)
{
  const auto top = node.children();
  std::vector<const SyntaxNode *> pending(top.begin(), top.end());
  while (!pending.empty()) {
    const SyntaxNode * current = pending.back();
    pending.pop_back();
    if (is_executable_stmt_kind(current->kind())) return true;

    const auto children = current->children();
    pending.insert(pending.end(), children.begin(), children.end());
  }
  return false;
}

std::vector<MemberCandidate> extract_members(const SyntaxNode & root, std::string_view file_name)
{
  std::vector<MemberCandidate> members;

  // Pre-order, children pushed last-first, so members come out in document order
  std::vector<PendingChild> pending{{&root, false}};
  while (!pending.empty()) {
    const PendingChild current = pending.back();
    pending.pop_back();

    if (current.in_member_container && has_executable_statement(*current.node)) {
      members.push_back(MemberCandidate{current.node, std::string(file_name)});
    }

    const auto children = current.node->children();
    const bool container = is_member_container(current.node->kind());
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      pending.push_back(PendingChild{*it, container});
    }
  }
  return members;
}

}  // namespace top100
