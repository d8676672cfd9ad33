#ifndef SWAPCHECK_PLUGIN_PERF_DATA_HPP
#define SWAPCHECK_PLUGIN_PERF_DATA_HPP
/**
 * @file PerfData.hpp
 * @brief Monitoring-plugin performance data entries.
 *
 * Wire format: 'label'=value[UOM];[warn];[crit]
 */

#include <string>      // std::string
#include <string_view> // std::string_view

namespace swapcheck {

namespace plugin {

/* ----------------------------- PerfDatum ----------------------------- */

/**
 * @brief One performance data entry.
 *
 * Value and ranges are kept as text so integers are printed exactly.
 */
struct PerfDatum {
  std::string label{};    ///< Metric label
  std::string value{};    ///< Measured value
  std::string unit{};     ///< Unit of measure ("%", "kB", "s", ...)
  std::string warning{};  ///< Warning range text, empty if none
  std::string critical{}; ///< Critical range text, empty if none

  /// @brief Render as "label=valueUOM;warn;crit".
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Quote a label if it contains characters special to the format.
 * @return label unchanged, or wrapped in single quotes with embedded
 *         quotes doubled.
 */
[[nodiscard]] std::string quoteLabel(std::string_view label);

} // namespace plugin

} // namespace swapcheck

#endif // SWAPCHECK_PLUGIN_PERF_DATA_HPP
