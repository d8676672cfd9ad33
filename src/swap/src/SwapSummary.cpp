/**
 * @file SwapSummary.cpp
 * @brief Row matching and column aggregation for the swap summary table.
 */

#include "src/swap/inc/SwapSummary.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <vector> // std::vector

#include <fmt/core.h>

namespace swapcheck {

namespace swap {

using swapcheck::helpers::strings::isUnsignedInteger;
using swapcheck::helpers::strings::parseUint64;
using swapcheck::helpers::strings::splitWhitespace;
using swapcheck::helpers::strings::trim;
using swapcheck::helpers::strings::trimRight;

namespace {

/// Number of numeric columns at the end of a row.
constexpr std::size_t NUMERIC_COLUMNS = 4;

/// Label the utility uses for its own sum row.
constexpr std::string_view TOTAL_LABEL = "Total";

/// Saturating add; counters never wrap.
inline std::uint64_t addSat(std::uint64_t a, std::uint64_t b) noexcept {
  return (a > UINT64_MAX - b) ? UINT64_MAX : a + b;
}

} // namespace

/* ----------------------------- Labels ----------------------------- */

const char* toString(LineVerdict verdict) noexcept {
  switch (verdict) {
  case LineVerdict::MATCHED:
    return "matched";
  case LineVerdict::NO_MATCH:
    return "no match";
  case LineVerdict::TOTAL_ROW:
    return "total row";
  case LineVerdict::MALFORMED:
  default:
    return "malformed";
  }
}

/* ----------------------------- SwapCounters ----------------------------- */

void SwapCounters::add(const SwapRow& row) noexcept {
  totalBlocks = addSat(totalBlocks, row.blocks);
  usedBlocks = addSat(usedBlocks, row.used);
  availableBlocks = addSat(availableBlocks, row.available);
  usagePercent = addSat(usagePercent, row.capacity);
  ++matchedRows;
}

std::string SwapCounters::toString() const {
  using swapcheck::helpers::format::kiloBlocksBinary;
  return fmt::format("rows={} total={} kB ({}) used={} kB ({}) avail={} kB ({}) capacity={}%",
                     matchedRows, totalBlocks, kiloBlocksBinary(totalBlocks), usedBlocks,
                     kiloBlocksBinary(usedBlocks), availableBlocks,
                     kiloBlocksBinary(availableBlocks), usagePercent);
}

/* ----------------------------- Matching ----------------------------- */

LineVerdict matchSummaryLine(std::string_view line, LineMode mode, SwapRow& out) {
  const std::string_view ROW = trimRight(line);
  if (ROW.empty() || ROW.back() != '%') {
    return LineVerdict::NO_MATCH;
  }

  const std::vector<std::string_view> FIELDS = splitWhitespace(ROW.substr(0, ROW.size() - 1));
  if (FIELDS.size() < NUMERIC_COLUMNS) {
    return LineVerdict::NO_MATCH;
  }

  // Capacity digits must touch the '%': "13 %" is not a match
  if (ROW.size() < 2 || helpers::strings::isSpace(ROW[ROW.size() - 2])) {
    return LineVerdict::NO_MATCH;
  }

  const std::size_t FIRST = FIELDS.size() - NUMERIC_COLUMNS;
  std::uint64_t values[NUMERIC_COLUMNS] = {0, 0, 0, 0};
  for (std::size_t i = 0; i < NUMERIC_COLUMNS; ++i) {
    const std::string_view F = FIELDS[FIRST + i];
    if (!isUnsignedInteger(F) || !parseUint64(F, values[i])) {
      return LineVerdict::NO_MATCH;
    }
  }

  // Label: everything before the first numeric column
  const std::string_view FIRST_NUM = FIELDS[FIRST];
  const std::string_view LABEL =
      trim(ROW.substr(0, static_cast<std::size_t>(FIRST_NUM.data() - ROW.data())));

  if (mode == LineMode::STRICT) {
    if (FIELDS.size() != NUMERIC_COLUMNS + 1 || isUnsignedInteger(FIELDS[0])) {
      return LineVerdict::MALFORMED;
    }
    if (FIELDS[0] == TOTAL_LABEL) {
      return LineVerdict::TOTAL_ROW;
    }
  }

  out.label = LABEL;
  out.blocks = values[0];
  out.used = values[1];
  out.available = values[2];
  out.capacity = values[3];
  return LineVerdict::MATCHED;
}

SwapCounters parseSwapSummary(std::string_view output, LineMode mode,
                              const helpers::verbose::Verbose& diag) {
  SwapCounters counters{};

  helpers::strings::forEachLine(output, [&](std::string_view line) {
    SwapRow row{};
    const LineVerdict VERDICT = matchSummaryLine(line, mode, row);
    if (VERDICT == LineVerdict::MATCHED) {
      counters.add(row);
    }
    diag.log(3, "  [{}] {}", toString(VERDICT), trimRight(line));
  });

  return counters;
}

} // namespace swap

} // namespace swapcheck
