/**
 * @file SwapCheck.cpp
 * @brief Swap check pipeline.
 */

#include "src/swap/inc/SwapCheck.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/plugin/inc/PerfData.hpp"

#include <cstdint> // std::uint64_t
#include <utility> // std::move

#include <fmt/core.h>

namespace swapcheck {

namespace swap {

using swapcheck::plugin::CheckResult;
using swapcheck::plugin::Deadline;
using swapcheck::plugin::Status;

/* ----------------------------- Options ----------------------------- */

bool parseTimeout(std::string_view text, std::chrono::seconds& out, std::string& error) {
  std::uint64_t secs = 0;
  if (!helpers::strings::isUnsignedInteger(text) || !helpers::strings::parseUint64(text, secs) ||
      secs == 0 || secs > static_cast<std::uint64_t>(MAX_TIMEOUT_SECONDS)) {
    error = fmt::format("Invalid timeout '{}': expected whole seconds between 1 and {}", text,
                        MAX_TIMEOUT_SECONDS);
    return false;
  }
  out = std::chrono::seconds{static_cast<long long>(secs)};
  return true;
}

bool makeCheckConfig(const CheckOptions& options, CheckConfig& out, std::string& error) {
  CheckConfig config{};

  if (!options.measurement) {
    error = fmt::format("Missing required argument '--measurement'; valid measurements are: {}",
                        validMetricNames());
    return false;
  }
  if (!parseSwapMetric(*options.measurement, config.metric)) {
    error = fmt::format("Invalid measurement '{}'; valid measurements are: {}",
                        *options.measurement, validMetricNames());
    return false;
  }

  const auto asView = [](const std::optional<std::string>& s) -> std::optional<std::string_view> {
    if (!s) {
      return std::nullopt;
    }
    return std::string_view{*s};
  };
  if (!plugin::parseThresholds(asView(options.warning), asView(options.critical),
                               config.thresholds, error)) {
    return false;
  }

  if (options.timeout && !parseTimeout(*options.timeout, config.timeout, error)) {
    return false;
  }

  config.verbosity = options.verbosity;
  config.lineMode = options.strict ? LineMode::STRICT : LineMode::PERMISSIVE;
  config.command = options.command;

  out = std::move(config);
  return true;
}

/* ----------------------------- Pipeline ----------------------------- */

SummaryCollector utilityCollector() {
  return [](const UtilityCommand& command, const Deadline& deadline,
            const helpers::verbose::Verbose& diag) {
    return collectSwapSummary(command, deadline, diag);
  };
}

std::string timeoutMessage(std::chrono::seconds timeout) {
  const long long SECS = timeout.count();
  return fmt::format("plugin timed out after {} second{}", SECS, SECS == 1 ? "" : "s");
}

CheckResult evaluateMetric(SwapMetric metric, const MetricValue& value,
                           const plugin::Thresholds& thresholds) {
  CheckResult result{};
  result.status = plugin::checkThresholds(static_cast<double>(value.value), thresholds);
  if (result.status == Status::OK && thresholds.empty()) {
    result.status = Status::UNKNOWN;
  }

  result.message = fmt::format("{}{} {}", value.value, value.unit, toString(metric));

  plugin::PerfDatum perf{};
  perf.label = toString(metric);
  perf.value = fmt::format("{}", value.value);
  perf.unit = value.unit;
  perf.warning = thresholds.warningText;
  perf.critical = thresholds.criticalText;
  result.perfData = perf.toString();
  return result;
}

CheckResult runSwapCheck(const CheckConfig& config, const SummaryCollector& collector,
                         const Deadline& deadline, const helpers::verbose::Verbose& diag) {
  CollectResult collected = collector(config.command, deadline, diag);
  if (collected.error == CollectError::TIMED_OUT || deadline.expired()) {
    return CheckResult::unknown(timeoutMessage(config.timeout));
  }
  if (!collected.ok()) {
    diag.log(1, "collection failed ({}): {}", toString(collected.error), collected.message);
    return CheckResult::unknown(std::move(collected.message));
  }
  diag.log(1, "collected {} bytes of swap summary", collected.output.size());

  const SwapCounters COUNTERS = parseSwapSummary(collected.output, config.lineMode, diag);
  diag.log(1, "aggregated {} swap device row(s)", COUNTERS.matchedRows);
  diag.log(2, "counters: {}", COUNTERS.toString());

  const MetricValue VALUE = selectMetric(config.metric, COUNTERS);
  CheckResult result = evaluateMetric(config.metric, VALUE, config.thresholds);

  if (deadline.expired()) {
    return CheckResult::unknown(timeoutMessage(config.timeout));
  }

  if (config.thresholds.empty()) {
    diag.log(1, "no warning or critical threshold given; reporting UNKNOWN");
  }
  diag.log(1, "{} = {}{} -> {}", toString(config.metric), VALUE.value, VALUE.unit,
           plugin::toString(result.status));
  return result;
}

CheckResult runCheck(const CheckOptions& options, const SummaryCollector& collector,
                     std::FILE* diagSink) {
  CheckConfig config{};
  std::string error;
  if (!makeCheckConfig(options, config, error)) {
    return CheckResult::unknown(std::move(error));
  }

  const Deadline DEADLINE = Deadline::after(config.timeout);
  const helpers::verbose::Verbose DIAG{config.verbosity, diagSink};
  DIAG.log(2, "measurement={} warning='{}' critical='{}' timeout={}s mode={}",
           toString(config.metric), config.thresholds.warningText,
           config.thresholds.criticalText, config.timeout.count(),
           config.lineMode == LineMode::STRICT ? "strict" : "permissive");

  return runSwapCheck(config, collector, DEADLINE, DIAG);
}

} // namespace swap

} // namespace swapcheck
