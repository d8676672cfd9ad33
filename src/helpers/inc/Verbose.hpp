#ifndef SWAPCHECK_HELPERS_VERBOSE_HPP
#define SWAPCHECK_HELPERS_VERBOSE_HPP
/**
 * @file Verbose.hpp
 * @brief Verbosity-gated diagnostic output.
 *
 * Monitoring plugins must print exactly one status line on stdout, so all
 * diagnostics go to a separate sink (stderr by default).
 *
 * Levels follow the monitoring-plugin convention:
 *  - 0: silent
 *  - 1: one line per pipeline stage
 *  - 2: commands run, exit status, aggregated values
 *  - 3: raw input lines and parse decisions
 */

#include <cstdio>
#include <utility>

#include <fmt/core.h>

namespace swapcheck {
namespace helpers {
namespace verbose {

/* ----------------------------- Constants ----------------------------- */

/// Highest meaningful verbosity level.
inline constexpr int MAX_VERBOSITY = 3;

/* ----------------------------- Verbose ----------------------------- */

/**
 * @brief Diagnostic printer with a fixed verbosity level.
 *
 * Cheap to copy; does not own the sink.
 */
class Verbose {
public:
  Verbose() noexcept = default;

  /// @param level Requested level; clamped to [0, MAX_VERBOSITY].
  /// @param sink  Output stream (nullptr disables output).
  explicit Verbose(int level, std::FILE* sink = stderr) noexcept
      : level_(level < 0 ? 0 : (level > MAX_VERBOSITY ? MAX_VERBOSITY : level)), sink_(sink) {}

  [[nodiscard]] int level() const noexcept { return level_; }

  /// True if messages at minLevel would be written.
  [[nodiscard]] bool enabled(int minLevel) const noexcept {
    return sink_ != nullptr && level_ >= minLevel;
  }

  /// Write one formatted line (newline appended) if level >= minLevel.
  template <typename... T>
  void log(int minLevel, fmt::format_string<T...> fmtStr, T&&... args) const {
    if (!enabled(minLevel)) {
      return;
    }
    fmt::print(sink_, fmtStr, std::forward<T>(args)...);
    std::fputc('\n', sink_);
  }

private:
  int level_{0};
  std::FILE* sink_{nullptr};
};

} // namespace verbose
} // namespace helpers
} // namespace swapcheck

#endif // SWAPCHECK_HELPERS_VERBOSE_HPP
