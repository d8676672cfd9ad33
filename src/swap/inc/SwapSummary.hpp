#ifndef SWAPCHECK_SWAP_SUMMARY_HPP
#define SWAPCHECK_SWAP_SUMMARY_HPP
/**
 * @file SwapSummary.hpp
 * @brief Parse and aggregate the swap utility's per-device summary table.
 * @note Thread-safe: All functions are stateless.
 *
 * Input is the text printed by the swap summary utility, e.g.:
 *
 *   Device          1K-blocks     Used    Avail Capacity
 *   /dev/ada0p3       4194304   524288  3670016    13%
 *   /dev/md0          2097152        0  2097152     0%
 *
 * A row matches when it ends with four whitespace-delimited unsigned
 * integers, the last one immediately followed by '%'. Matching rows are
 * summed column-wise; other rows (headers, blank lines) are skipped.
 */

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t, std::uint64_t
#include <string>      // std::string
#include <string_view> // std::string_view

#include "src/helpers/inc/Verbose.hpp"

namespace swapcheck {

namespace swap {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Row matching policy.
 */
enum class LineMode : std::uint8_t {
  PERMISSIVE = 0, ///< Any row ending in "N N N N%" counts (the Total row too)
  STRICT,         ///< Exactly "DEVICE N N N N%", DEVICE non-numeric and not "Total"
};

/**
 * @brief Outcome of matching one row.
 */
enum class LineVerdict : std::uint8_t {
  MATCHED = 0, ///< Row counted
  NO_MATCH,    ///< Row does not end in four numeric columns with '%'
  TOTAL_ROW,   ///< STRICT only: utility's own total row, skipped
  MALFORMED,   ///< STRICT only: numeric tail but wrong column layout
};

/**
 * @brief Convert LineVerdict to a lower-case label.
 * @note Returns pointer to static string.
 */
[[nodiscard]] const char* toString(LineVerdict verdict) noexcept;

/* ----------------------------- SwapRow ----------------------------- */

/// One matched row.
struct SwapRow {
  std::string_view label{};    ///< Text before the numeric columns (device), may be empty
  std::uint64_t blocks{0};     ///< 1K-blocks
  std::uint64_t used{0};       ///< Used
  std::uint64_t available{0};  ///< Avail
  std::uint64_t capacity{0};   ///< Capacity (percent, without '%')
};

/* ----------------------------- SwapCounters ----------------------------- */

/**
 * @brief Column-wise sums over all matched rows.
 *
 * Each field is the sum of its column; a row that fails to match
 * contributes nothing. All zero when nothing matched.
 */
struct SwapCounters {
  std::uint64_t totalBlocks{0};     ///< Sum of 1K-blocks
  std::uint64_t usedBlocks{0};      ///< Sum of Used
  std::uint64_t availableBlocks{0}; ///< Sum of Avail
  std::uint64_t usagePercent{0};    ///< Sum of Capacity
  std::size_t matchedRows{0};       ///< Number of rows summed

  /// @brief Add one row into the sums.
  void add(const SwapRow& row) noexcept;

  /// @brief One-line summary for diagnostics.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Match one output row.
 * @param line Row text without the newline.
 * @param mode Matching policy.
 * @param out  Parsed row when MATCHED (unchanged otherwise).
 * @return Verdict for the row.
 */
[[nodiscard]] LineVerdict matchSummaryLine(std::string_view line, LineMode mode, SwapRow& out);

/**
 * @brief Aggregate all matching rows of the utility output.
 * @param output Raw utility stdout.
 * @param mode   Matching policy.
 * @param diag   Diagnostics sink; level 3 logs each row and its verdict.
 * @return Summed counters (all zero when nothing matched; not an error).
 */
[[nodiscard]] SwapCounters parseSwapSummary(std::string_view output,
                                            LineMode mode = LineMode::PERMISSIVE,
                                            const helpers::verbose::Verbose& diag = {});

} // namespace swap

} // namespace swapcheck

#endif // SWAPCHECK_SWAP_SUMMARY_HPP
