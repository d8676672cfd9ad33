#ifndef SWAPCHECK_PLUGIN_STATUS_HPP
#define SWAPCHECK_PLUGIN_STATUS_HPP
/**
 * @file PluginStatus.hpp
 * @brief Monitoring-plugin service states and the check result triple.
 *
 * Exit codes follow the plugin convention understood by Nagios-compatible
 * supervisors: 0 OK, 1 WARNING, 2 CRITICAL, 3 UNKNOWN.
 */

#include <cstdint>     // std::uint8_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace swapcheck {

namespace plugin {

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Service state reported to the supervisor.
 *
 * Enumerator values are the process exit codes.
 */
enum class Status : std::uint8_t {
  OK = 0,       ///< Value within thresholds
  WARNING = 1,  ///< Warning range breached
  CRITICAL = 2, ///< Critical range breached
  UNKNOWN = 3,  ///< Check could not run or could not be judged
};

/**
 * @brief Convert Status to its upper-case plugin label ("OK", "WARNING", ...).
 * @note Returns pointer to static string.
 */
[[nodiscard]] const char* toString(Status status) noexcept;

/// Process exit code for a status.
[[nodiscard]] constexpr int exitCode(Status status) noexcept { return static_cast<int>(status); }

/* ----------------------------- CheckResult ----------------------------- */

/**
 * @brief Terminal result of one check run.
 *
 * perfData is empty when no metric value was produced (configuration,
 * environment, collection and timeout errors).
 */
struct CheckResult {
  Status status{Status::UNKNOWN};
  std::string message{};
  std::string perfData{};

  /// @brief Build an UNKNOWN result without performance data.
  [[nodiscard]] static CheckResult unknown(std::string msg);
};

/**
 * @brief Render the single status line printed on stdout.
 * @param shortName Service prefix, e.g. "SWAP".
 * @param result    Result to render.
 * @return "SWAP OK - 42% swap_usage | swap_usage=42%;80;90" (no trailing newline).
 */
[[nodiscard]] std::string formatStatusLine(std::string_view shortName, const CheckResult& result);

} // namespace plugin

} // namespace swapcheck

#endif // SWAPCHECK_PLUGIN_STATUS_HPP
