// top100/metrics/nesting_depth.cpp - Maximum control-flow nesting depth
#include "top100/metrics/nesting_depth.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace top100
{

uint32_t nesting_depth(const SyntaxNode & node)
{
  // The recurrence unrolls to the largest number of enlargers on any path
  // from `node` (exclusive) down to a descendant.
  uint32_t deepest = 0;
  std::vector<std::pair<const SyntaxNode *, uint32_t>> pending{{&node, 0U}};
  while (!pending.empty()) {
    const auto [current, depth] = pending.back();
    pending.pop_back();
    deepest = std::max(deepest, depth);

    for (const SyntaxNode * child : current->children()) {
      pending.emplace_back(child, depth + (is_nesting_enlarger(child->kind()) ? 1U : 0U));
    }
  }
  return deepest;
}

}  // namespace top100
