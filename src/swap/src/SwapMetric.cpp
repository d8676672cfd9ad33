/**
 * @file SwapMetric.cpp
 * @brief Measurement names, units and selectors.
 */

#include "src/swap/inc/SwapMetric.hpp"

namespace swapcheck {

namespace swap {

const char* toString(SwapMetric metric) noexcept {
  switch (metric) {
  case SwapMetric::TOTAL_BLOCKS:
    return "total_swap_blocks";
  case SwapMetric::USED_BLOCKS:
    return "used_swap_blocks";
  case SwapMetric::AVAILABLE_BLOCKS:
    return "available_swap_blocks";
  case SwapMetric::USAGE_PERCENT:
    return "swap_usage";
  }
  return "unknown";
}

const char* unitOf(SwapMetric metric) noexcept {
  switch (metric) {
  case SwapMetric::TOTAL_BLOCKS:
  case SwapMetric::USED_BLOCKS:
  case SwapMetric::AVAILABLE_BLOCKS:
    return "kB";
  case SwapMetric::USAGE_PERCENT:
    return "%";
  }
  return "";
}

bool parseSwapMetric(std::string_view name, SwapMetric& out) noexcept {
  for (const SwapMetric M : ALL_SWAP_METRICS) {
    if (name == toString(M)) {
      out = M;
      return true;
    }
  }
  return false;
}

std::string validMetricNames() {
  std::string out;
  for (const SwapMetric M : ALL_SWAP_METRICS) {
    if (!out.empty()) {
      out.append(", ");
    }
    out.append(toString(M));
  }
  return out;
}

MetricValue selectMetric(SwapMetric metric, const SwapCounters& counters) noexcept {
  MetricValue mv{};
  mv.unit = unitOf(metric);

  switch (metric) {
  case SwapMetric::TOTAL_BLOCKS:
    mv.value = counters.totalBlocks;
    break;
  case SwapMetric::USED_BLOCKS:
    mv.value = counters.usedBlocks;
    break;
  case SwapMetric::AVAILABLE_BLOCKS:
    mv.value = counters.availableBlocks;
    break;
  case SwapMetric::USAGE_PERCENT:
    mv.value = counters.usagePercent;
    break;
  }
  return mv;
}

} // namespace swap

} // namespace swapcheck
