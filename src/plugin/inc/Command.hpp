#ifndef SWAPCHECK_PLUGIN_COMMAND_HPP
#define SWAPCHECK_PLUGIN_COMMAND_HPP
/**
 * @file Command.hpp
 * @brief Run an external command under a deadline and capture its stdout.
 * @note Linux/POSIX. Uses posix_spawn, pipe2 and poll.
 *
 * The child runs in its own process group with stdin from /dev/null and
 * stderr inherited. When the deadline expires the whole group is killed with
 * SIGKILL and reaped for at most KILL_GRACE. A child stuck in uninterruptible
 * sleep past that is abandoned so the caller still returns on time.
 */

#include <chrono>  // std::chrono::milliseconds
#include <cstddef> // std::size_t
#include <cstdint> // std::uint8_t
#include <string>  // std::string
#include <vector>  // std::vector

#include <sys/types.h> // pid_t

#include "src/plugin/inc/Deadline.hpp"

namespace swapcheck {

namespace plugin {

/* ----------------------------- Constants ----------------------------- */

/// Default cap on captured stdout; excess output is read and discarded.
inline constexpr std::size_t DEFAULT_MAX_OUTPUT = 1024 * 1024;

/// Longest wait for a killed child to be reaped.
inline constexpr std::chrono::milliseconds KILL_GRACE{200};

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief How a command run ended.
 */
enum class CommandOutcome : std::uint8_t {
  EXITED = 0,   ///< Child exited normally; exitCode is valid
  SIGNALED,     ///< Child was terminated by a signal; termSignal is valid
  TIMED_OUT,    ///< Deadline expired; child group was killed
  SPAWN_FAILED, ///< Pipe or spawn failed; spawnErrno is valid
};

/**
 * @brief Convert CommandOutcome to a lower-case label.
 * @note Returns pointer to static string.
 */
[[nodiscard]] const char* toString(CommandOutcome outcome) noexcept;

/* ----------------------------- CommandResult ----------------------------- */

struct CommandResult {
  CommandOutcome outcome{CommandOutcome::SPAWN_FAILED};
  int exitCode{-1};   ///< Exit status when EXITED
  int termSignal{0};  ///< Signal number when SIGNALED
  int spawnErrno{0};  ///< errno when SPAWN_FAILED
  std::string output; ///< Captured stdout (possibly truncated to the cap)
  std::chrono::milliseconds elapsed{0};

  /// @brief True if the command exited with status 0.
  [[nodiscard]] bool succeeded() const noexcept {
    return outcome == CommandOutcome::EXITED && exitCode == 0;
  }

  /// @brief Exit status suitable for messages: exit code, 128+signal, or -1.
  [[nodiscard]] int statusCode() const noexcept;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Render argv as a shell-like command line for messages.
 */
[[nodiscard]] std::string formatCommand(const std::vector<std::string>& argv);

/**
 * @brief SIGKILL the process group led by pid, then reap pid.
 * @param pid   Child process and process-group id.
 * @param grace Longest time to wait for the child to be reaped.
 * @return true if the child was reaped (or is not ours); false if it was
 *         still alive when grace ran out.
 */
[[nodiscard]] bool killGroupAndReap(pid_t pid, std::chrono::milliseconds grace) noexcept;

/**
 * @brief Run argv[0] (absolute path, no PATH search) and capture stdout.
 * @param argv      Program path followed by its arguments; must be non-empty.
 * @param deadline  Run budget; the child is killed when it expires.
 * @param maxOutput Cap on captured bytes.
 * @return Outcome, status and captured output. Never throws on process errors.
 */
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       const Deadline& deadline,
                                       std::size_t maxOutput = DEFAULT_MAX_OUTPUT);

} // namespace plugin

} // namespace swapcheck

#endif // SWAPCHECK_PLUGIN_COMMAND_HPP
