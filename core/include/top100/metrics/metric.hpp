// top100/metrics/metric.hpp - Metric selection
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "top100/metrics/statement_count.hpp"
#include "top100/syntax/syntax_tree.hpp"

namespace top100
{

enum class Metric : uint8_t {
  StatementCount,  ///< Total statements in the member
  NestingDepth,    ///< Deepest chain of nested control-flow constructs
};

[[nodiscard]] constexpr std::string_view to_string(Metric metric) noexcept
{
  switch (metric) {
    case Metric::StatementCount:
      return "statements";
    case Metric::NestingDepth:
      return "nesting";
  }
  return "";
}

/**
 * Both metric values of one function-like member.
 */
struct MeasuredMember
{
  std::string file;  ///< File base name
  uint32_t line = 0;
  uint32_t statements = 0;
  uint32_t nesting = 0;

  [[nodiscard]] uint32_t value(Metric metric) const noexcept
  {
    return metric == Metric::StatementCount ? statements : nesting;
  }
};

/// Score `node` by `metric`; `set` only affects Metric::StatementCount
[[nodiscard]] uint32_t measure(
  Metric metric, const SyntaxNode & node, StatementSet set = StatementSet::Simple);

}  // namespace top100
