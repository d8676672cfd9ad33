/**
 * @file check-swap.cpp
 * @brief Monitoring plugin: swap usage from the system swap summary utility.
 *
 * Prints exactly one status line on stdout and exits with the plugin
 * status code (0 OK, 1 WARNING, 2 CRITICAL, 3 UNKNOWN). Diagnostics
 * requested with -v go to stderr.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Verbose.hpp"
#include "src/plugin/inc/ExtraOpts.hpp"
#include "src/plugin/inc/PluginStatus.hpp"
#include "src/swap/inc/SwapCheck.hpp"
#include "src/swap/inc/SwapMetric.hpp"

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#ifndef SWAPCHECK_VERSION
#define SWAPCHECK_VERSION "0.0.0"
#endif

namespace args = swapcheck::helpers::args;
namespace plugin = swapcheck::plugin;
namespace swap = swapcheck::swap;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_WARNING = 0,
  ARG_CRITICAL = 1,
  ARG_MEASUREMENT = 2,
  ARG_TIMEOUT = 3,
  ARG_VERBOSE = 4,
  ARG_STRICT = 5,
  ARG_EXTRA_OPTS = 6,
  ARG_HELP = 7,
  ARG_USAGE = 8,
  ARG_VERSION = 9,
};

constexpr std::string_view DESCRIPTION =
    "Check swap space by summing the per-device rows of the swap summary utility.\n"
    "Reports one measurement and compares it with the warning and critical ranges.\n"
    "\n"
    "Range syntax: N (alert outside 0..N), N: (alert below N), ~:N (alert above N),\n"
    "M:N (alert outside M..N); a leading @ alerts inside the range instead.";

constexpr std::string_view USAGE_LINE =
    "Usage: check_swap -m MEASUREMENT [-w RANGE] [-c RANGE] [-t SECONDS] [-v...]\n"
    "                  [--strict] [--extra-opts=[section][@file]]";

/// Long names of options that take no value (used to expand INI switches).
constexpr std::string_view SWITCHES[] = {"verbose", "strict", "help", "usage", "version"};

args::ArgMap buildArgMap(const std::string& measurementDesc) {
  args::ArgMap map;
  map[ARG_WARNING] = {"--warning", 'w', 1, false, "Warning range", "RANGE"};
  map[ARG_CRITICAL] = {"--critical", 'c', 1, false, "Critical range", "RANGE"};
  // desc must outlive the map; measurementDesc is owned by main()
  map[ARG_MEASUREMENT] = {"--measurement", 'm', 1, false, measurementDesc, "NAME"};
  map[ARG_TIMEOUT] = {"--timeout", 't', 1, false,
                      "Seconds before the plugin gives up (default 15)", "SECONDS"};
  map[ARG_VERBOSE] = {"--verbose", 'v', 0, false, "More diagnostics on stderr (repeatable)"};
  map[ARG_STRICT] = {"--strict", '\0', 0, false,
                     "Only accept 'DEVICE N N N N%' rows and skip the Total row"};
  map[ARG_EXTRA_OPTS] = {"--extra-opts", '\0', 1, false, "Read options from an INI section",
                         "[section][@file]"};
  map[ARG_HELP] = {"--help", 'h', 0, false, "Show this help message"};
  map[ARG_USAGE] = {"--usage", '\0', 0, false, "Show a short usage line"};
  map[ARG_VERSION] = {"--version", 'V', 0, false, "Show version"};
  return map;
}

std::optional<std::string> optionalString(const args::ParsedArgs& pargs, std::uint8_t key) {
  const std::optional<std::string_view> V = args::lastValue(pargs, key);
  if (!V) {
    return std::nullopt;
  }
  return std::string{*V};
}

int finish(const plugin::CheckResult& result) {
  fmt::print("{}\n", plugin::formatStatusLine(swap::SHORT_NAME, result));
  return plugin::exitCode(result.status);
}

int usageError(const std::string& message) {
  fmt::print("{}\n",
             plugin::formatStatusLine(swap::SHORT_NAME, plugin::CheckResult::unknown(message)));
  fmt::print(stderr, "{}\n", USAGE_LINE);
  return plugin::exitCode(plugin::Status::UNKNOWN);
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const std::string MEASUREMENT_DESC =
      fmt::format("Measurement to check: {}", swap::validMetricNames());
  const args::ArgMap ARG_MAP = buildArgMap(MEASUREMENT_DESC);

  std::vector<std::string> raw;
  raw.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
  for (int i = 1; i < argc; ++i) {
    raw.emplace_back(argv[i]);
  }

  // INI options go first so the command line overrides them
  std::vector<std::string> expanded;
  std::string error;
  if (!plugin::expandExtraOpts(raw, swap::PLUGIN_NAME, SWITCHES, expanded, error)) {
    return usageError(error);
  }

  std::vector<std::string_view> argViews;
  argViews.reserve(expanded.size());
  for (const std::string& A : expanded) {
    argViews.emplace_back(A);
  }

  args::ParsedArgs pargs;
  if (!args::parseArgs(argViews, ARG_MAP, pargs, error)) {
    return usageError(error);
  }

  if (pargs.count(ARG_HELP) != 0) {
    fmt::print("check_swap {}\n\n", SWAPCHECK_VERSION);
    args::printUsage(swap::PLUGIN_NAME, DESCRIPTION, ARG_MAP);
    return plugin::exitCode(plugin::Status::UNKNOWN);
  }
  if (pargs.count(ARG_USAGE) != 0) {
    fmt::print("{}\n", USAGE_LINE);
    return plugin::exitCode(plugin::Status::UNKNOWN);
  }
  if (pargs.count(ARG_VERSION) != 0) {
    fmt::print("check_swap {}\n", SWAPCHECK_VERSION);
    return plugin::exitCode(plugin::Status::UNKNOWN);
  }

  swap::CheckOptions options{};
  options.measurement = optionalString(pargs, ARG_MEASUREMENT);
  options.warning = optionalString(pargs, ARG_WARNING);
  options.critical = optionalString(pargs, ARG_CRITICAL);
  options.timeout = optionalString(pargs, ARG_TIMEOUT);
  options.verbosity = static_cast<int>(args::occurrences(pargs, ARG_VERBOSE));
  options.strict = (pargs.count(ARG_STRICT) != 0);

  const swapcheck::helpers::verbose::Verbose DIAG{options.verbosity};
  DIAG.log(2, "arguments: {}", fmt::join(expanded, " "));

  return finish(swap::runCheck(options, swap::utilityCollector(), stderr));
}
