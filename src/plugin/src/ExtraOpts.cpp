/**
 * @file ExtraOpts.cpp
 * @brief INI section loading for --extra-opts (Boost.PropertyTree).
 */

#include "src/plugin/inc/ExtraOpts.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm> // std::find
#include <cctype>    // std::tolower
#include <cstdint>   // std::uint64_t
#include <cstdlib>   // std::getenv

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fmt/core.h>

namespace swapcheck {

namespace plugin {

namespace bpt = boost::property_tree;

namespace {

/* ----------------------------- Constants ----------------------------- */

/// File names tried in each $NAGIOS_CONFIG_PATH directory.
constexpr std::string_view CONFIG_FILE_NAMES[] = {
    "monitoring-plugins.ini",
    "plugins.ini",
    "nagios-plugins.ini",
};

/// Standard locations, in search order.
constexpr std::string_view DEFAULT_CONFIG_FILES[] = {
    "/etc/monitoring-plugins/monitoring-plugins.ini",
    "/etc/monitoring-plugins.ini",
    "/usr/local/etc/monitoring-plugins/monitoring-plugins.ini",
    "/usr/local/etc/monitoring-plugins.ini",
    "/etc/nagios-plugins/nagios-plugins.ini",
    "/etc/nagios-plugins.ini",
    "/usr/local/etc/nagios-plugins/nagios-plugins.ini",
    "/usr/local/etc/nagios-plugins.ini",
    "/etc/nagios/plugins.ini",
    "/usr/local/etc/nagios/plugins.ini",
    "/usr/local/nagios/etc/plugins.ini",
    "/etc/opt/nagios/plugins.ini",
};

/// Upper bound for "verbose = N" style repeat counts.
constexpr std::uint64_t MAX_SWITCH_REPEAT = 10;

/* ----------------------------- Helpers ----------------------------- */

std::string lowerCopy(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

/// Interpret a switch value: 0 = off, N = repeat N times, -1 = invalid.
long long switchRepeat(std::string_view value) {
  const std::string V = lowerCopy(value);
  if (V.empty() || V == "true" || V == "yes" || V == "on") {
    return 1;
  }
  if (V == "false" || V == "no" || V == "off") {
    return 0;
  }
  std::uint64_t n = 0;
  if (swapcheck::helpers::strings::isUnsignedInteger(V) &&
      swapcheck::helpers::strings::parseUint64(V, n) && n <= MAX_SWITCH_REPEAT) {
    return static_cast<long long>(n);
  }
  return -1;
}

std::string optionToken(std::string_view key) {
  return (key.size() == 1) ? fmt::format("-{}", key) : fmt::format("--{}", key);
}

bool findFirstReadable(const std::vector<std::string>& candidates, std::string& out) {
  for (const std::string& PATH : candidates) {
    if (swapcheck::helpers::files::isRegularFile(PATH.c_str()) &&
        swapcheck::helpers::files::isReadable(PATH.c_str())) {
      out = PATH;
      return true;
    }
  }
  return false;
}

} // namespace

/* ----------------------------- API ----------------------------- */

ExtraOptsTarget parseExtraOptsTarget(std::string_view value, std::string_view defaultSection) {
  ExtraOptsTarget target{};
  const std::size_t AT = value.find('@');
  const std::string_view SECTION = value.substr(0, AT);
  target.section.assign(SECTION.empty() ? defaultSection : SECTION);
  if (AT != std::string_view::npos) {
    target.file.assign(value.substr(AT + 1));
  }
  return target;
}

std::vector<std::string> candidateConfigFiles(const char* mpConfigFile,
                                              const char* nagiosConfigPath) {
  std::vector<std::string> files;

  if (mpConfigFile != nullptr && *mpConfigFile != '\0') {
    files.emplace_back(mpConfigFile);
  }

  if (nagiosConfigPath != nullptr) {
    std::string_view dirs{nagiosConfigPath};
    while (!dirs.empty()) {
      const std::size_t COLON = dirs.find(':');
      const std::string_view DIR = dirs.substr(0, COLON);
      if (!DIR.empty()) {
        for (const std::string_view NAME : CONFIG_FILE_NAMES) {
          files.push_back(fmt::format("{}/{}", DIR, NAME));
        }
      }
      if (COLON == std::string_view::npos) {
        break;
      }
      dirs.remove_prefix(COLON + 1);
    }
  }

  for (const std::string_view PATH : DEFAULT_CONFIG_FILES) {
    files.emplace_back(PATH);
  }
  return files;
}

bool loadIniSection(const std::string& file, const std::string& section, IniEntries& out,
                    std::string& error) {
  bpt::ptree tree;
  try {
    bpt::ini_parser::read_ini(file, tree);
  } catch (const bpt::ini_parser_error& ex) {
    error = (ex.line() > 0)
                ? fmt::format("{}:{}: {}", file, ex.line(), ex.message())
                : fmt::format("{}: {}", file, ex.message());
    return false;
  }

  // find() instead of get_child(): section names may contain the path separator '.'
  const auto IT = tree.find(section);
  if (IT == tree.not_found()) {
    error = fmt::format("section [{}] not found in {}", section, file);
    return false;
  }

  IniEntries entries;
  for (const auto& KV : IT->second) {
    entries.emplace_back(KV.first, KV.second.data());
  }
  out = std::move(entries);
  return true;
}

bool entriesToArgs(const IniEntries& entries, std::span<const std::string_view> switches,
                   std::vector<std::string>& out, std::string& error) {
  for (const auto& [KEY, VALUE] : entries) {
    const bool IS_SWITCH = std::find(switches.begin(), switches.end(), KEY) != switches.end();
    if (IS_SWITCH) {
      const long long REPEAT = switchRepeat(VALUE);
      if (REPEAT < 0) {
        error = fmt::format("option '{}' expects a boolean or a count, got '{}'", KEY, VALUE);
        return false;
      }
      for (long long i = 0; i < REPEAT; ++i) {
        out.push_back(optionToken(KEY));
      }
      continue;
    }

    if (VALUE.empty()) {
      out.push_back(optionToken(KEY));
    } else if (KEY.size() == 1) {
      out.push_back(optionToken(KEY) + VALUE);
    } else {
      out.push_back(fmt::format("--{}={}", KEY, VALUE));
    }
  }
  return true;
}

bool expandExtraOpts(const std::vector<std::string>& args, std::string_view defaultSection,
                     std::span<const std::string_view> switches, std::vector<std::string>& out,
                     std::string& error) {
  std::vector<std::string> loaded;
  std::vector<std::string> rest;
  rest.reserve(args.size());

  for (const std::string& ARG : args) {
    const std::string_view TOK{ARG};
    const bool BARE = (TOK == EXTRA_OPTS_FLAG);
    const bool WITH_VALUE = TOK.size() > EXTRA_OPTS_FLAG.size() &&
                            TOK.substr(0, EXTRA_OPTS_FLAG.size()) == EXTRA_OPTS_FLAG &&
                            TOK[EXTRA_OPTS_FLAG.size()] == '=';
    if (!BARE && !WITH_VALUE) {
      rest.push_back(ARG);
      continue;
    }

    const ExtraOptsTarget TARGET = parseExtraOptsTarget(
        WITH_VALUE ? TOK.substr(EXTRA_OPTS_FLAG.size() + 1) : std::string_view{}, defaultSection);

    std::string file = TARGET.file;
    if (file.empty() &&
        !findFirstReadable(candidateConfigFiles(std::getenv("MP_CONFIG_FILE"),
                                                std::getenv("NAGIOS_CONFIG_PATH")),
                           file)) {
      error = "--extra-opts: no configuration file found in the default locations";
      return false;
    }

    IniEntries entries;
    std::string why;
    if (!loadIniSection(file, TARGET.section, entries, why) ||
        !entriesToArgs(entries, switches, loaded, why)) {
      error = fmt::format("--extra-opts: {}", why);
      return false;
    }
  }

  out = std::move(loaded);
  out.insert(out.end(), rest.begin(), rest.end());
  return true;
}

} // namespace plugin

} // namespace swapcheck
