/**
 * @file PluginStatus.cpp
 * @brief Status labels and status line rendering.
 */

#include "src/plugin/inc/PluginStatus.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace swapcheck {

namespace plugin {

const char* toString(Status status) noexcept {
  switch (status) {
  case Status::OK:
    return "OK";
  case Status::WARNING:
    return "WARNING";
  case Status::CRITICAL:
    return "CRITICAL";
  case Status::UNKNOWN:
  default:
    return "UNKNOWN";
  }
}

/* ----------------------------- CheckResult ----------------------------- */

CheckResult CheckResult::unknown(std::string msg) {
  CheckResult r{};
  r.status = Status::UNKNOWN;
  r.message = std::move(msg);
  return r;
}

std::string formatStatusLine(std::string_view shortName, const CheckResult& result) {
  std::string line = fmt::format("{} {} - {}", shortName, toString(result.status), result.message);
  if (!result.perfData.empty()) {
    line.append(" | ").append(result.perfData);
  }
  return line;
}

} // namespace plugin

} // namespace swapcheck
