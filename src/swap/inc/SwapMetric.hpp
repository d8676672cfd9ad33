#ifndef SWAPCHECK_SWAP_METRIC_HPP
#define SWAPCHECK_SWAP_METRIC_HPP
/**
 * @file SwapMetric.hpp
 * @brief The four measurements the swap check can report.
 * @note Thread-safe: All functions are pure.
 */

#include <array>       // std::array
#include <cstdint>     // std::uint8_t, std::uint64_t
#include <string>      // std::string
#include <string_view> // std::string_view

#include "src/swap/inc/SwapSummary.hpp"

namespace swapcheck {

namespace swap {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Measurement selected with --measurement.
 */
enum class SwapMetric : std::uint8_t {
  TOTAL_BLOCKS = 0, ///< total_swap_blocks: sum of 1K-blocks column
  USED_BLOCKS,      ///< used_swap_blocks: sum of Used column
  AVAILABLE_BLOCKS, ///< available_swap_blocks: sum of Avail column
  USAGE_PERCENT,    ///< swap_usage: sum of Capacity column
};

/// All metrics, in help/message order.
inline constexpr std::array<SwapMetric, 4> ALL_SWAP_METRICS = {
    SwapMetric::TOTAL_BLOCKS,
    SwapMetric::USED_BLOCKS,
    SwapMetric::AVAILABLE_BLOCKS,
    SwapMetric::USAGE_PERCENT,
};

/**
 * @brief Measurement name as used on the command line and in perfdata.
 * @note Returns pointer to static string.
 */
[[nodiscard]] const char* toString(SwapMetric metric) noexcept;

/**
 * @brief Unit of measure of a metric ("kB" or "%").
 * @note Returns pointer to static string.
 */
[[nodiscard]] const char* unitOf(SwapMetric metric) noexcept;

/**
 * @brief Parse a measurement name (exact, case-sensitive).
 * @param name Name from the command line.
 * @param out  Parsed metric (unchanged on failure).
 * @return false if name is not one of the four measurement names.
 */
[[nodiscard]] bool parseSwapMetric(std::string_view name, SwapMetric& out) noexcept;

/// Comma-separated list of valid measurement names, for error messages.
[[nodiscard]] std::string validMetricNames();

/* ----------------------------- Selection ----------------------------- */

/**
 * @brief Value selected from the counters, with its unit.
 */
struct MetricValue {
  std::uint64_t value{0};
  const char* unit{""};
};

/**
 * @brief Select the requested metric from aggregated counters.
 * @note Exhaustive over SwapMetric.
 */
[[nodiscard]] MetricValue selectMetric(SwapMetric metric, const SwapCounters& counters) noexcept;

} // namespace swap

} // namespace swapcheck

#endif // SWAPCHECK_SWAP_METRIC_HPP
