/**
 * @file Deadline.cpp
 * @brief Deadline arithmetic.
 */

#include "src/plugin/inc/Deadline.hpp"

#include <algorithm> // std::min, std::max

namespace swapcheck {

namespace plugin {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

Deadline Deadline::after(milliseconds budget) noexcept {
  Deadline d{};
  d.at_ = Clock::now() + std::max(budget, milliseconds{0});
  d.bounded_ = true;
  return d;
}

bool Deadline::expired() const noexcept { return bounded_ && Clock::now() >= at_; }

milliseconds Deadline::remaining() const noexcept {
  if (!bounded_) {
    return milliseconds::max();
  }
  const auto NOW = Clock::now();
  if (NOW >= at_) {
    return milliseconds{0};
  }
  // Round up so a sub-millisecond remainder still waits
  return duration_cast<milliseconds>(at_ - NOW) + milliseconds{1};
}

int Deadline::pollTimeoutMs(milliseconds cap) const noexcept {
  const milliseconds LEFT = std::min(remaining(), cap);
  return static_cast<int>(std::max(LEFT, milliseconds{0}).count());
}

} // namespace plugin

} // namespace swapcheck
