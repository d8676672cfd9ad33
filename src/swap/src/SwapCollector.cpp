/**
 * @file SwapCollector.cpp
 * @brief Utility precondition checks and output capture.
 */

#include "src/swap/inc/SwapCollector.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/plugin/inc/Command.hpp"

#include <cstring> // std::strerror
#include <utility> // std::move

#include <fmt/core.h>

namespace swapcheck {

namespace swap {

using swapcheck::plugin::CommandOutcome;
using swapcheck::plugin::CommandResult;

namespace {

CollectResult failure(CollectError error, std::string message, int exitStatus = -1) {
  CollectResult r{};
  r.error = error;
  r.exitStatus = exitStatus;
  r.message = std::move(message);
  return r;
}

} // namespace

/* ----------------------------- Labels ----------------------------- */

const char* toString(CollectError error) noexcept {
  switch (error) {
  case CollectError::NONE:
    return "none";
  case CollectError::MISSING:
    return "missing";
  case CollectError::NOT_A_FILE:
    return "not a file";
  case CollectError::NOT_EXECUTABLE:
    return "not executable";
  case CollectError::SPAWN_FAILED:
    return "spawn failed";
  case CollectError::COMMAND_FAILED:
    return "command failed";
  case CollectError::NO_DATA:
    return "no data";
  case CollectError::TIMED_OUT:
  default:
    return "timed out";
  }
}

std::vector<std::string> UtilityCommand::argv() const {
  std::vector<std::string> out;
  out.reserve(args.size() + 1);
  out.push_back(path);
  out.insert(out.end(), args.begin(), args.end());
  return out;
}

/* ----------------------------- Preconditions ----------------------------- */

CollectError checkUtility(const std::string& path) noexcept {
  namespace files = swapcheck::helpers::files;

  if (!files::pathExists(path.c_str())) {
    return CollectError::MISSING;
  }
  if (!files::isRegularFile(path.c_str())) {
    return CollectError::NOT_A_FILE;
  }
  if (!files::isExecutable(path.c_str())) {
    return CollectError::NOT_EXECUTABLE;
  }
  return CollectError::NONE;
}

/* ----------------------------- Collection ----------------------------- */

CollectResult collectSwapSummary(const UtilityCommand& command, const plugin::Deadline& deadline,
                                 const helpers::verbose::Verbose& diag) {
  switch (checkUtility(command.path)) {
  case CollectError::MISSING:
    return failure(CollectError::MISSING, fmt::format("{} does not exist", command.path));
  case CollectError::NOT_A_FILE:
    return failure(CollectError::NOT_A_FILE, fmt::format("{} is not a file", command.path));
  case CollectError::NOT_EXECUTABLE:
    return failure(CollectError::NOT_EXECUTABLE,
                   fmt::format("{} is not executable", command.path));
  default:
    break;
  }

  const std::vector<std::string> ARGV = command.argv();
  const std::string CMDLINE = plugin::formatCommand(ARGV);
  diag.log(2, "running '{}'", CMDLINE);

  const CommandResult RUN = plugin::runCommand(ARGV, deadline);

  switch (RUN.outcome) {
  case CommandOutcome::TIMED_OUT:
    diag.log(1, "'{}' killed after {} ms", CMDLINE, RUN.elapsed.count());
    return failure(CollectError::TIMED_OUT, fmt::format("'{}' timed out", CMDLINE));
  case CommandOutcome::SPAWN_FAILED:
    return failure(CollectError::SPAWN_FAILED,
                   fmt::format("could not run '{}': {}", CMDLINE, std::strerror(RUN.spawnErrno)));
  case CommandOutcome::SIGNALED:
    return failure(CollectError::COMMAND_FAILED,
                   fmt::format("'{}' was killed by signal {} (exit status {})", CMDLINE,
                               RUN.termSignal, RUN.statusCode()),
                   RUN.statusCode());
  case CommandOutcome::EXITED:
    break;
  }

  diag.log(2, "'{}' exited with status {} after {} ms, {} bytes of output", CMDLINE,
           RUN.exitCode, RUN.elapsed.count(), RUN.output.size());

  if (RUN.exitCode != 0) {
    return failure(CollectError::COMMAND_FAILED,
                   fmt::format("'{}' returned exit status {}", CMDLINE, RUN.exitCode),
                   RUN.exitCode);
  }

  if (helpers::strings::isBlank(RUN.output)) {
    return failure(CollectError::NO_DATA,
                   fmt::format("no usable data from '{}' (exit status {})", CMDLINE,
                               RUN.exitCode),
                   RUN.exitCode);
  }

  CollectResult r{};
  r.error = CollectError::NONE;
  r.exitStatus = RUN.exitCode;
  r.output = RUN.output;
  return r;
}

} // namespace swap

} // namespace swapcheck
