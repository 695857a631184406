// top100/metrics/statement_count.cpp - Statement count metric
#include "top100/metrics/statement_count.hpp"

#include <vector>

namespace top100
{

std::optional<StatementSet> parse_statement_set(std::string_view name) noexcept
{
  if (name == "simple") return StatementSet::Simple;
  if (name == "all") return StatementSet::All;
  return std::nullopt;
}

uint32_t statement_count(const SyntaxNode & node, StatementSet set)
{
  uint32_t count = 0;
  std::vector<const SyntaxNode *> pending{&node};
  while (!pending.empty()) {
    const SyntaxNode * current = pending.back();
    pending.pop_back();
    if (counts_as_statement(current->kind(), set)) ++count;

    const auto children = current->children();
    pending.insert(pending.end(), children.begin(), children.end());
  }
  return count;
}

}  // namespace top100
