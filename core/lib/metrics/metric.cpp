// top100/metrics/metric.cpp - Metric selection
#include "top100/metrics/metric.hpp"

#include "top100/metrics/nesting_depth.hpp"

namespace top100
{

uint32_t measure(Metric metric, const SyntaxNode & node, StatementSet set)
{
  switch (metric) {
    case Metric::StatementCount:
      return statement_count(node, set);
    case Metric::NestingDepth:
      return nesting_depth(node);
  }
  return 0;
}

}  // namespace top100
