#ifndef SWAPCHECK_SWAP_CHECK_HPP
#define SWAPCHECK_SWAP_CHECK_HPP
/**
 * @file SwapCheck.hpp
 * @brief The swap check pipeline: validate, collect, aggregate, evaluate.
 *
 * Stages run once per invocation, in order:
 *  1. makeCheckConfig()    - measurement, thresholds and timeout are
 *                            validated before anything is spawned
 *  2. collector            - runs the swap utility under the deadline
 *  3. parseSwapSummary()   - column sums across all device rows
 *  4. selectMetric()       - value and unit of the requested measurement
 *  5. evaluateMetric()     - status, message and perfdata
 *
 * Every failure resolves to a CheckResult; nothing throws past runCheck().
 */

#include <chrono>      // std::chrono::seconds
#include <cstdio>      // std::FILE
#include <functional>  // std::function
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

#include "src/helpers/inc/Verbose.hpp"
#include "src/plugin/inc/Deadline.hpp"
#include "src/plugin/inc/PluginStatus.hpp"
#include "src/plugin/inc/Threshold.hpp"
#include "src/swap/inc/SwapCollector.hpp"
#include "src/swap/inc/SwapMetric.hpp"
#include "src/swap/inc/SwapSummary.hpp"

namespace swapcheck {

namespace swap {

/* ----------------------------- Constants ----------------------------- */

/// Plugin name; also the default --extra-opts section.
inline constexpr std::string_view PLUGIN_NAME = "check_swap";

/// Service prefix of the status line.
inline constexpr std::string_view SHORT_NAME = "SWAP";

/// Largest accepted --timeout, in seconds.
inline constexpr long long MAX_TIMEOUT_SECONDS = 86400;

/* ----------------------------- Options ----------------------------- */

/**
 * @brief Unvalidated options as gathered from the command line.
 */
struct CheckOptions {
  std::optional<std::string> measurement{};
  std::optional<std::string> warning{};
  std::optional<std::string> critical{};
  std::optional<std::string> timeout{};
  int verbosity{0};
  bool strict{false};
  UtilityCommand command{};
};

/**
 * @brief Validated, immutable configuration of one run.
 */
struct CheckConfig {
  SwapMetric metric{SwapMetric::USAGE_PERCENT};
  plugin::Thresholds thresholds{};
  std::chrono::seconds timeout{plugin::DEFAULT_TIMEOUT};
  int verbosity{0};
  LineMode lineMode{LineMode::PERMISSIVE};
  UtilityCommand command{};
};

/**
 * @brief Parse a --timeout value.
 * @param text  Whole number of seconds, 1..MAX_TIMEOUT_SECONDS.
 * @param out   Parsed timeout (unchanged on failure).
 * @param error Reason on failure.
 */
[[nodiscard]] bool parseTimeout(std::string_view text, std::chrono::seconds& out,
                                std::string& error);

/**
 * @brief Validate options into a CheckConfig.
 *
 * Rejects a missing or unknown measurement (listing the valid names),
 * malformed threshold ranges and bad timeouts.
 *
 * @return false with error set on the first invalid option.
 */
[[nodiscard]] bool makeCheckConfig(const CheckOptions& options, CheckConfig& out,
                                   std::string& error);

/* ----------------------------- Pipeline ----------------------------- */

/// Source of raw utility output for one run, given the configured command.
using SummaryCollector = std::function<CollectResult(
    const UtilityCommand&, const plugin::Deadline&, const helpers::verbose::Verbose&)>;

/// Collector that runs the command through collectSwapSummary().
[[nodiscard]] SummaryCollector utilityCollector();

/// "plugin timed out after N second(s)"
[[nodiscard]] std::string timeoutMessage(std::chrono::seconds timeout);

/**
 * @brief Judge a selected value against the thresholds.
 *
 * CRITICAL range first, then WARNING, else OK. An OK result with neither
 * threshold supplied becomes UNKNOWN: there is nothing to judge against.
 *
 * @return Status, "<value><unit> <metric>" message and perfdata.
 */
[[nodiscard]] plugin::CheckResult evaluateMetric(SwapMetric metric, const MetricValue& value,
                                                 const plugin::Thresholds& thresholds);

/**
 * @brief Run collection, aggregation and evaluation for a validated config.
 * @param config    Validated configuration.
 * @param collector Output source, called with config.command.
 * @param deadline  Run budget; expiry at any stage yields the timeout result.
 * @param diag      Diagnostics printer.
 */
[[nodiscard]] plugin::CheckResult runSwapCheck(const CheckConfig& config,
                                               const SummaryCollector& collector,
                                               const plugin::Deadline& deadline,
                                               const helpers::verbose::Verbose& diag = {});

/**
 * @brief Validate options, then run the check under a deadline of
 *        the configured timeout.
 *
 * Configuration errors are returned before the collector is called.
 * Diagnostics are printed to diagSink at config.verbosity; they never
 * change the result.
 */
[[nodiscard]] plugin::CheckResult runCheck(const CheckOptions& options,
                                           const SummaryCollector& collector,
                                           std::FILE* diagSink = nullptr);

} // namespace swap

} // namespace swapcheck

#endif // SWAPCHECK_SWAP_CHECK_HPP
