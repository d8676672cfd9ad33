#ifndef SWAPCHECK_PLUGIN_THRESHOLD_HPP
#define SWAPCHECK_PLUGIN_THRESHOLD_HPP
/**
 * @file Threshold.hpp
 * @brief Monitoring-plugin threshold ranges and warning/critical evaluation.
 *
 * Range syntax (standard plugin convention):
 *
 *   | Text     | Alert when                   |
 *   |----------|------------------------------|
 *   | "10"     | value < 0 or value > 10      |
 *   | "10:"    | value < 10                   |
 *   | ":10"    | value < 0 or value > 10      |
 *   | "~:10"   | value > 10                   |
 *   | "10:20"  | value < 10 or value > 20     |
 *   | "@10:20" | 10 <= value <= 20            |
 *
 * Bounds are inclusive. Numbers may carry a sign and a decimal part.
 */

#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

#include "src/plugin/inc/PluginStatus.hpp"

namespace swapcheck {

namespace plugin {

/* ----------------------------- ThresholdRange ----------------------------- */

/**
 * @brief Parsed range. Default-constructed range is "0:" (alert below zero).
 */
struct ThresholdRange {
  double start{0.0};          ///< Lower bound (ignored when startInfinite)
  double end{0.0};            ///< Upper bound (ignored when endInfinite)
  bool startInfinite{false};  ///< "~" lower bound
  bool endInfinite{true};     ///< Empty upper bound
  bool alertInside{false};    ///< "@" prefix: alert inside instead of outside

  /// @brief True if value breaches the range.
  [[nodiscard]] bool shouldAlert(double value) const noexcept;
};

/**
 * @brief Parse range text.
 * @param text  Range in plugin syntax (surrounding whitespace is not allowed).
 * @param out   Parsed range (unchanged on failure).
 * @param error Human-readable reason on failure.
 * @return false on empty text, bad numbers, or start greater than end.
 */
[[nodiscard]] bool parseRange(std::string_view text, ThresholdRange& out, std::string& error);

/* ----------------------------- Thresholds ----------------------------- */

/**
 * @brief Optional warning and critical ranges with their text as given.
 *
 * The text as given is echoed unchanged in performance data.
 */
struct Thresholds {
  std::optional<ThresholdRange> warning{};
  std::optional<ThresholdRange> critical{};
  std::string warningText{};
  std::string criticalText{};

  /// @brief True if neither threshold was supplied.
  [[nodiscard]] bool empty() const noexcept { return !warning && !critical; }
};

/**
 * @brief Build Thresholds from optional range texts.
 * @param warningText  Warning range, or nullopt when not supplied.
 * @param criticalText Critical range, or nullopt when not supplied.
 * @param out          Parsed thresholds (unchanged on failure).
 * @param error        Names the offending option on failure.
 * @return false if either text is malformed.
 */
[[nodiscard]] bool parseThresholds(std::optional<std::string_view> warningText,
                                   std::optional<std::string_view> criticalText, Thresholds& out,
                                   std::string& error);

/**
 * @brief Evaluate a value: CRITICAL if the critical range alerts, else
 *        WARNING if the warning range alerts, else OK.
 * @note Plain range logic; the "no thresholds means UNKNOWN" rule is applied
 *       by the caller.
 */
[[nodiscard]] Status checkThresholds(double value, const Thresholds& thresholds) noexcept;

} // namespace plugin

} // namespace swapcheck

#endif // SWAPCHECK_PLUGIN_THRESHOLD_HPP
