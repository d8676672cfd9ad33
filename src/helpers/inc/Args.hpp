#ifndef SWAPCHECK_HELPERS_ARGS_HPP
#define SWAPCHECK_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Parses monitoring-plugin style options: long flags ("--warning 80",
 * "--warning=80"), short flags ("-w 80", "-w80") and bundled short switches
 * ("-vvv"). Options take zero or one value. Cold-path only.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace swapcheck {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;       ///< Long flag string, e.g. "--warning"
  char shortFlag;              ///< Short flag character, e.g. 'w'; '\0' if none
  std::uint8_t nargs;          ///< 0 for a switch, 1 for an option taking a value
  bool required;               ///< True if flag must be provided
  std::string_view desc{};     ///< Description for help output (optional)
  std::string_view metavar{};  ///< Value placeholder for help output, e.g. "RANGE"
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values. Every occurrence appends one entry; switches append "".
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

namespace detail {

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  std::string_view flag;
};

inline void setError(std::optional<std::reference_wrapper<std::string>>& error,
                     std::string msg) {
  if (error) {
    error->get() = std::move(msg);
  }
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * Options needing a value take it from the same token ("--name=value",
 * "-nvalue") or, failing that, consume the next token literally, so values
 * starting with '-' (e.g. "-w -5:") are accepted.
 *
 * @param args   Argument list (non-owning views; must outlive the call and pargs).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (occurrences are appended).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on unknown options, missing values,
 *         unexpected positional arguments or missing required flags.
 * @note Cold-path: Allocates internally.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  // Build reverse LUTs once: flag -> compact view
  std::unordered_map<std::string_view, detail::ArgDefView> longLut;
  std::unordered_map<char, detail::ArgDefView> shortLut;
  longLut.reserve(map.size());
  for (const auto& KV : map) {
    const ArgDef& DEF = KV.second;
    const detail::ArgDefView VIEW{KV.first, DEF.nargs, DEF.flag};
    longLut.emplace(DEF.flag, VIEW);
    if (DEF.shortFlag != '\0') {
      shortLut.emplace(DEF.shortFlag, VIEW);
    }
  }

  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];

    if (TOK.size() > 2 && TOK.substr(0, 2) == "--") {
      const std::size_t EQ = TOK.find('=');
      const std::string_view NAME = TOK.substr(0, EQ);
      auto it = longLut.find(NAME);
      if (it == longLut.end()) {
        detail::setError(error, fmt::format("Unknown option '{}'", NAME));
        return false;
      }

      const detail::ArgDefView& D = it->second;
      if (D.need == 0) {
        if (EQ != std::string_view::npos) {
          detail::setError(error, fmt::format("Option '{}' does not take a value", D.flag));
          return false;
        }
        pargs[D.key].emplace_back();
        continue;
      }

      if (EQ != std::string_view::npos) {
        pargs[D.key].emplace_back(TOK.substr(EQ + 1));
        continue;
      }

      if (i + 1 >= N) {
        detail::setError(error, fmt::format("Option '{}' requires a value", D.flag));
        return false;
      }
      pargs[D.key].emplace_back(args[++i]);
      continue;
    }

    if (TOK.size() > 1 && TOK[0] == '-' && TOK != "--") {
      // Short cluster: switches may be bundled, the first value option ends it
      for (std::size_t j = 1; j < TOK.size(); ++j) {
        auto it = shortLut.find(TOK[j]);
        if (it == shortLut.end()) {
          detail::setError(error, fmt::format("Unknown option '-{}'", TOK[j]));
          return false;
        }

        const detail::ArgDefView& D = it->second;
        if (D.need == 0) {
          pargs[D.key].emplace_back();
          continue;
        }

        if (j + 1 < TOK.size()) {
          pargs[D.key].emplace_back(TOK.substr(j + 1));
        } else if (i + 1 < N) {
          pargs[D.key].emplace_back(args[++i]);
        } else {
          detail::setError(error, fmt::format("Option '-{}' requires a value", TOK[j]));
          return false;
        }
        break;
      }
      continue;
    }

    detail::setError(error, fmt::format("Unexpected argument '{}'", TOK));
    return false;
  }

  // Validate required flags
  for (const auto& KV : map) {
    const ArgDef& DEF = KV.second;
    if (DEF.required && pargs.count(KV.first) == 0) {
      detail::setError(error, fmt::format("Missing required argument '{}'", DEF.flag));
      return false;
    }
  }

  return true;
}

/// Number of times a flag occurred.
[[nodiscard]] inline std::size_t occurrences(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  auto it = pargs.find(key);
  return (it == pargs.end()) ? 0 : it->second.size();
}

/// Last value given for a flag; nullopt if the flag was not given.
[[nodiscard]] inline std::optional<std::string_view> lastValue(const ParsedArgs& pargs,
                                                               std::uint8_t key) noexcept {
  auto it = pargs.find(key);
  if (it == pargs.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back();
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * Generates formatted help text from the argument map.
 *
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(std::string_view progName, std::string_view description,
                       const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  // Collect and sort flags for consistent output
  std::vector<std::pair<std::string_view, const ArgDef*>> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.emplace_back(KV.second.flag, &KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  // Build flag column: "-w, --warning=RANGE"
  std::vector<std::string> flagStrs;
  flagStrs.reserve(entries.size());
  std::size_t maxFlagWidth = 0;
  for (const auto& ENTRY : entries) {
    const ArgDef& DEF = *ENTRY.second;
    std::string flagStr;
    flagStr.reserve(32);
    if (DEF.shortFlag != '\0') {
      flagStr.push_back('-');
      flagStr.push_back(DEF.shortFlag);
      flagStr.append(", ");
    } else {
      flagStr.append("    ");
    }
    flagStr.append(DEF.flag);
    if (DEF.nargs > 0) {
      flagStr.push_back('=');
      flagStr.append(DEF.metavar.empty() ? std::string_view{"VALUE"} : DEF.metavar);
    }
    maxFlagWidth = std::max(maxFlagWidth, flagStr.size());
    flagStrs.push_back(std::move(flagStr));
  }

  // Minimum padding and cap
  maxFlagWidth = std::clamp<std::size_t>(maxFlagWidth, 16, 36);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const ArgDef& DEF = *entries[i].second;

    fmt::print("  {:<{}}  ", flagStrs[i], maxFlagWidth);

    if (!DEF.desc.empty()) {
      fmt::print("{}", DEF.desc);
    }

    if (DEF.required) {
      if (!DEF.desc.empty()) {
        fmt::print(" ");
      }
      fmt::print("(required)");
    }

    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace swapcheck

#endif // SWAPCHECK_HELPERS_ARGS_HPP
