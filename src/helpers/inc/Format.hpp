#ifndef SWAPCHECK_HELPERS_FORMAT_HPP
#define SWAPCHECK_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting utilities for swap sizes.
 *
 * Used by verbose diagnostics. Uses fmt library for string formatting.
 *
 * @note All functions return std::string (heap allocation). Cold path only.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace swapcheck {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format a count of 1K blocks (the swap utility's unit) in binary units.
 *
 * Scales from KiB upward without converting to bytes, so any uint64 count
 * formats without overflow.
 *
 * @param blocks Number of 1024-byte blocks.
 * @return Formatted string (e.g., "512 KiB", "4.0 GiB").
 */
[[nodiscard]] inline std::string kiloBlocksBinary(std::uint64_t blocks) {
  static constexpr const char* UNITS[] = {"MiB", "GiB", "TiB", "PiB", "EiB", "ZiB"};
  static constexpr double STEP = 1024.0;

  if (blocks < 1024ULL) {
    return fmt::format("{} KiB", blocks);
  }

  double scaled = static_cast<double>(blocks) / STEP;
  std::size_t unit = 0;
  while (scaled >= STEP && unit + 1 < sizeof(UNITS) / sizeof(UNITS[0])) {
    scaled /= STEP;
    ++unit;
  }
  return fmt::format("{:.1f} {}", scaled, UNITS[unit]);
}

} // namespace format
} // namespace helpers
} // namespace swapcheck

#endif // SWAPCHECK_HELPERS_FORMAT_HPP
