// top100/metrics/ranker.hpp - Deterministic top-N ranking of scored members
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "top100/metrics/metric.hpp"

namespace top100
{

/// Default number of results per metric
inline constexpr size_t k_default_rank_limit = 100;

/**
 * One ranked entry: a member's file base name, start line and metric value.
 */
struct ScoredResult
{
  std::string file;
  uint32_t line = 0;
  uint32_t value = 0;

  [[nodiscard]] bool operator==(const ScoredResult & other) const noexcept
  {
    return value == other.value && line == other.line && file == other.file;
  }
  [[nodiscard]] bool operator!=(const ScoredResult & other) const noexcept
  {
    return !(*this == other);
  }
};

/// The entry `member` contributes to the ranking by `metric`
[[nodiscard]] ScoredResult make_result(const MeasuredMember & member, Metric metric);

/**
 * Ranking order: value descending, then file ascending, then line ascending.
 */
[[nodiscard]] bool ranks_before(const ScoredResult & a, const ScoredResult & b) noexcept;

/**
 * Sort `results` by ranks_before and keep the first `limit` entries.
 *
 * Returns min(limit, results.size()) entries. The outcome depends only on the
 * multiset of inputs, not on their incoming order.
 */
[[nodiscard]] std::vector<ScoredResult> rank(std::vector<ScoredResult> results, size_t limit);

/// Text form of one entry: "<value>\t<file>:<line>"
[[nodiscard]] std::string format_result(const ScoredResult & result);

}  // namespace top100
