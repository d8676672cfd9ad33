#ifndef SWAPCHECK_SWAP_COLLECTOR_HPP
#define SWAPCHECK_SWAP_COLLECTOR_HPP
/**
 * @file SwapCollector.hpp
 * @brief Run the swap summary utility and capture its output.
 * @note POSIX. Spawns one child process per call; no retries.
 *
 * Preconditions are checked before spawning: the utility must exist, be a
 * regular file and be executable. Each violation has its own error kind so
 * the message can say which check failed.
 */

#include <cstdint> // std::uint8_t
#include <string>  // std::string
#include <vector>  // std::vector

#include "src/helpers/inc/Verbose.hpp"
#include "src/plugin/inc/Deadline.hpp"

namespace swapcheck {

namespace swap {

/* ----------------------------- Constants ----------------------------- */

#ifndef SWAPCHECK_SWAPINFO_PATH
#define SWAPCHECK_SWAPINFO_PATH "/usr/sbin/swapinfo"
#endif

#ifndef SWAPCHECK_SWAPINFO_FLAG
#define SWAPCHECK_SWAPINFO_FLAG "-k"
#endif

/// Default swap summary utility.
inline constexpr const char* DEFAULT_UTILITY_PATH = SWAPCHECK_SWAPINFO_PATH;

/// Flag requesting the per-device summary in 1K blocks.
inline constexpr const char* DEFAULT_UTILITY_FLAG = SWAPCHECK_SWAPINFO_FLAG;

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Why collection failed.
 */
enum class CollectError : std::uint8_t {
  NONE = 0,        ///< Output captured
  MISSING,         ///< Utility path does not exist
  NOT_A_FILE,      ///< Utility path is not a regular file
  NOT_EXECUTABLE,  ///< Utility is not executable by this process
  SPAWN_FAILED,    ///< Could not start the utility
  COMMAND_FAILED,  ///< Non-zero exit status or killed by a signal
  NO_DATA,         ///< Exit status 0 but output empty or whitespace only
  TIMED_OUT,       ///< Run deadline expired
};

/**
 * @brief Convert CollectError to a lower-case label.
 * @note Returns pointer to static string.
 */
[[nodiscard]] const char* toString(CollectError error) noexcept;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Utility command line.
 */
struct UtilityCommand {
  std::string path{DEFAULT_UTILITY_PATH};
  std::vector<std::string> args{DEFAULT_UTILITY_FLAG};

  /// @brief path followed by args.
  [[nodiscard]] std::vector<std::string> argv() const;
};

/**
 * @brief Result of one collection attempt.
 */
struct CollectResult {
  CollectError error{CollectError::NONE};
  int exitStatus{-1};   ///< Utility exit status when it ran (128+N for signal N)
  std::string output{}; ///< Raw stdout when error is NONE
  std::string message{}; ///< Human-readable failure reason, empty on success

  [[nodiscard]] bool ok() const noexcept { return error == CollectError::NONE; }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check utility preconditions without running it.
 * @return NONE, MISSING, NOT_A_FILE or NOT_EXECUTABLE.
 */
[[nodiscard]] CollectError checkUtility(const std::string& path) noexcept;

/**
 * @brief Verify the utility, run it and capture its output.
 * @param command  Utility command line.
 * @param deadline Run budget; the child is killed when it expires.
 * @param diag     Diagnostics sink.
 * @return Captured output, or the failure kind and message.
 */
[[nodiscard]] CollectResult collectSwapSummary(const UtilityCommand& command,
                                               const plugin::Deadline& deadline,
                                               const helpers::verbose::Verbose& diag = {});

} // namespace swap

} // namespace swapcheck

#endif // SWAPCHECK_SWAP_COLLECTOR_HPP
