#ifndef SWAPCHECK_PLUGIN_DEADLINE_HPP
#define SWAPCHECK_PLUGIN_DEADLINE_HPP
/**
 * @file Deadline.hpp
 * @brief Wall-clock budget for one plugin run.
 *
 * A Deadline is fixed at startup from --timeout and handed to every stage
 * that may block. Blocking calls wait at most remaining(); stages check
 * expired() before producing a result so a timeout wins over work in
 * progress.
 *
 * @note Uses std::chrono::steady_clock; immune to wall-clock adjustments.
 */

#include <chrono> // std::chrono

namespace swapcheck {

namespace plugin {

/* ----------------------------- Constants ----------------------------- */

/// Default plugin timeout (monitoring-plugin convention).
inline constexpr std::chrono::seconds DEFAULT_TIMEOUT{15};

/* ----------------------------- Deadline ----------------------------- */

class Deadline {
public:
  using Clock = std::chrono::steady_clock;

  /// @brief Unbounded deadline; never expires.
  Deadline() noexcept = default;

  /// @brief Deadline budget from now; negative budgets count as zero.
  [[nodiscard]] static Deadline after(std::chrono::milliseconds budget) noexcept;

  /// @brief True once the budget is used up.
  [[nodiscard]] bool expired() const noexcept;

  /**
   * @brief Time left, clamped to zero.
   * @return Remaining time; milliseconds::max() when unbounded.
   */
  [[nodiscard]] std::chrono::milliseconds remaining() const noexcept;

  /**
   * @brief Timeout argument for poll(2).
   * @param cap Upper bound on the wait (keeps loops responsive).
   * @return Milliseconds in [0, cap]; cap when unbounded.
   */
  [[nodiscard]] int pollTimeoutMs(std::chrono::milliseconds cap) const noexcept;

private:
  Clock::time_point at_{};
  bool bounded_{false};
};

} // namespace plugin

} // namespace swapcheck

#endif // SWAPCHECK_PLUGIN_DEADLINE_HPP
