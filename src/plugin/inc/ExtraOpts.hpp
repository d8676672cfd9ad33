#ifndef SWAPCHECK_PLUGIN_EXTRA_OPTS_HPP
#define SWAPCHECK_PLUGIN_EXTRA_OPTS_HPP
/**
 * @file ExtraOpts.hpp
 * @brief --extra-opts support: read plugin options from an INI file section.
 *
 * Syntax: --extra-opts=[section][@file]
 *  - section defaults to the plugin name (e.g. "check_swap")
 *  - without @file the standard monitoring-plugin locations are searched
 *
 * Every "key = value" line of the section becomes "--key=value" (or "-kvalue"
 * for single-letter keys). INI options are placed before the command-line
 * options, so the command line wins for value options.
 *
 * Example plugins.ini:
 * @code
 *   [check_swap]
 *   measurement = swap_usage
 *   warning = 80
 *   critical = 90
 *   verbose = 2
 * @endcode
 */

#include <span>        // std::span
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::pair
#include <vector>      // std::vector

namespace swapcheck {

namespace plugin {

/* ----------------------------- Constants ----------------------------- */

/// Option name recognized on the command line.
inline constexpr std::string_view EXTRA_OPTS_FLAG = "--extra-opts";

/* ----------------------------- Types ----------------------------- */

/// Parsed --extra-opts value.
struct ExtraOptsTarget {
  std::string section{}; ///< INI section name
  std::string file{};    ///< Explicit INI file; empty to search default locations
};

/// Ordered key/value pairs of one INI section.
using IniEntries = std::vector<std::pair<std::string, std::string>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse "[section][@file]".
 * @param value          Text after "--extra-opts=" (may be empty).
 * @param defaultSection Section used when none is given.
 * @return Parsed target.
 */
[[nodiscard]] ExtraOptsTarget parseExtraOptsTarget(std::string_view value,
                                               std::string_view defaultSection);

/**
 * @brief Ordered list of INI files to try when no file was given.
 * @param mpConfigFile     Value of $MP_CONFIG_FILE (nullptr if unset).
 * @param nagiosConfigPath Value of $NAGIOS_CONFIG_PATH (nullptr if unset).
 */
[[nodiscard]] std::vector<std::string> candidateConfigFiles(const char* mpConfigFile,
                                                            const char* nagiosConfigPath);

/**
 * @brief Read one section of an INI file.
 * @param file    INI file path.
 * @param section Section name.
 * @param out     Entries in file order (unchanged on failure).
 * @param error   Reason on failure.
 * @return false if the file cannot be read or parsed, or lacks the section.
 */
[[nodiscard]] bool loadIniSection(const std::string& file, const std::string& section,
                                  IniEntries& out, std::string& error);

/**
 * @brief Turn INI entries into command-line tokens.
 * @param entries  Section entries.
 * @param switches Long names (without "--") of options that take no value.
 *                 Their INI value is a boolean ("", 1/0, true/false, yes/no,
 *                 on/off) or a repeat count ("verbose = 3").
 * @param out      Tokens appended in entry order.
 * @param error    Reason on failure.
 * @return false if a switch has a value that is neither boolean nor count.
 */
[[nodiscard]] bool entriesToArgs(const IniEntries& entries,
                                 std::span<const std::string_view> switches,
                                 std::vector<std::string>& out, std::string& error);

/**
 * @brief Replace every --extra-opts occurrence with the options it names.
 *
 * Recognizes "--extra-opts" and "--extra-opts=VALUE". All loaded options
 * are placed in front of the remaining arguments, in order of occurrence.
 * Default file search reads $MP_CONFIG_FILE and $NAGIOS_CONFIG_PATH.
 *
 * @param args           Arguments without argv[0].
 * @param defaultSection Plugin name used as default section.
 * @param switches       See entriesToArgs().
 * @param out            Expanded arguments.
 * @param error          Reason on failure.
 * @return false if any referenced file or section cannot be loaded.
 */
[[nodiscard]] bool expandExtraOpts(const std::vector<std::string>& args,
                                   std::string_view defaultSection,
                                   std::span<const std::string_view> switches,
                                   std::vector<std::string>& out, std::string& error);

} // namespace plugin

} // namespace swapcheck

#endif // SWAPCHECK_PLUGIN_EXTRA_OPTS_HPP
