// top100/metrics/ranker.cpp - Deterministic top-N ranking of scored members
#include "top100/metrics/ranker.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>

namespace top100
{

ScoredResult make_result(const MeasuredMember & member, Metric metric)
{
  return ScoredResult{member.file, member.line, member.value(metric)};
}

bool ranks_before(const ScoredResult & a, const ScoredResult & b) noexcept
{
  if (a.value != b.value) return a.value > b.value;
  if (a.file != b.file) return a.file < b.file;
  return a.line < b.line;
}

std::vector<ScoredResult> rank(std::vector<ScoredResult> results, size_t limit)
{
  std::stable_sort(results.begin(), results.end(), ranks_before);
  if (results.size() > limit) {
    results.erase(results.begin() + static_cast<std::ptrdiff_t>(limit), results.end());
  }
  return results;
}

std::string format_result(const ScoredResult & result)
{
  return fmt::format("{}\t{}:{}", result.value, result.file, result.line);
}

}  // namespace top100
