/**
 * @file Command.cpp
 * @brief posix_spawn based command runner with deadline enforcement.
 */

#include "src/plugin/inc/Command.hpp"
#include "src/helpers/inc/Files.hpp"

#include <fcntl.h>    // O_CLOEXEC, O_RDONLY
#include <poll.h>     // poll
#include <signal.h>   // kill, SIGKILL
#include <spawn.h>    // posix_spawn
#include <sys/wait.h> // waitpid
#include <time.h>     // nanosleep
#include <unistd.h>   // pipe2, read

#include <array>  // std::array
#include <cerrno> // errno

extern char** environ;

namespace swapcheck {

namespace plugin {

using swapcheck::helpers::files::FdGuard;
using std::chrono::milliseconds;

namespace {

/* ----------------------------- Constants ----------------------------- */

/// Longest single poll() wait; bounds reaction time to deadline expiry.
constexpr milliseconds POLL_SLICE{100};

/// Interval between non-blocking waitpid() calls.
constexpr long REAP_INTERVAL_NS = 5L * 1000 * 1000;

void sleepBriefly() noexcept {
  struct timespec ts{};
  ts.tv_sec = 0;
  ts.tv_nsec = REAP_INTERVAL_NS;
  ::nanosleep(&ts, nullptr);
}

/* ----------------------------- ChildGuard ----------------------------- */

/// Owns a spawned child; kills its process group and reaps it unless reaped.
class ChildGuard {
public:
  explicit ChildGuard(pid_t pid) noexcept : pid_(pid) {}
  ~ChildGuard() { killAndReap(); }

  ChildGuard(const ChildGuard&) = delete;
  ChildGuard& operator=(const ChildGuard&) = delete;

  /// Non-blocking reap. Returns true once the child has exited.
  bool tryReap(int& status) noexcept {
    if (pid_ <= 0) {
      return true;
    }
    const pid_t R = ::waitpid(pid_, &status, WNOHANG);
    if (R == pid_) {
      pid_ = -1;
      return true;
    }
    if (R < 0 && errno != EINTR) {
      // Lost track of the child (ECHILD); nothing left to wait for
      pid_ = -1;
      status = 0;
      return true;
    }
    return false;
  }

  void killAndReap() noexcept {
    if (pid_ <= 0) {
      return;
    }
    // A child that outlives the grace period is left for init to reap
    (void)killGroupAndReap(pid_, KILL_GRACE);
    pid_ = -1;
  }

private:
  pid_t pid_{-1};
};

/// Spawn attributes and file actions released on scope exit.
struct SpawnSetup {
  posix_spawn_file_actions_t actions{};
  posix_spawnattr_t attr{};
  bool actionsInit{false};
  bool attrInit{false};

  SpawnSetup() = default;
  SpawnSetup(const SpawnSetup&) = delete;
  SpawnSetup& operator=(const SpawnSetup&) = delete;

  ~SpawnSetup() {
    if (actionsInit) {
      ::posix_spawn_file_actions_destroy(&actions);
    }
    if (attrInit) {
      ::posix_spawnattr_destroy(&attr);
    }
  }
};

CommandResult spawnFailed(int err) {
  CommandResult r{};
  r.outcome = CommandOutcome::SPAWN_FAILED;
  r.spawnErrno = err;
  return r;
}

} // namespace

/* ----------------------------- Labels ----------------------------- */

const char* toString(CommandOutcome outcome) noexcept {
  switch (outcome) {
  case CommandOutcome::EXITED:
    return "exited";
  case CommandOutcome::SIGNALED:
    return "signaled";
  case CommandOutcome::TIMED_OUT:
    return "timed out";
  case CommandOutcome::SPAWN_FAILED:
  default:
    return "spawn failed";
  }
}

int CommandResult::statusCode() const noexcept {
  switch (outcome) {
  case CommandOutcome::EXITED:
    return exitCode;
  case CommandOutcome::SIGNALED:
    return 128 + termSignal;
  default:
    return -1;
  }
}

std::string formatCommand(const std::vector<std::string>& argv) {
  std::string out;
  for (const std::string& ARG : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(ARG);
  }
  return out;
}

/* ----------------------------- Child Cleanup ----------------------------- */

bool killGroupAndReap(pid_t pid, milliseconds grace) noexcept {
  if (pid <= 0) {
    return true;
  }
  ::kill(-pid, SIGKILL);

  const Deadline GRACE = Deadline::after(grace);
  int status = 0;
  while (true) {
    const pid_t R = ::waitpid(pid, &status, WNOHANG);
    if (R == pid || (R < 0 && errno != EINTR)) {
      return true;
    }
    if (GRACE.expired()) {
      return false;
    }
    sleepBriefly();
  }
}

/* ----------------------------- runCommand ----------------------------- */

CommandResult runCommand(const std::vector<std::string>& argv, const Deadline& deadline,
                         std::size_t maxOutput) {
  if (argv.empty()) {
    return spawnFailed(EINVAL);
  }

  const auto START = Deadline::Clock::now();

  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return spawnFailed(errno);
  }
  FdGuard readEnd{fds[0]};
  FdGuard writeEnd{fds[1]};

  SpawnSetup setup{};
  int rc = ::posix_spawn_file_actions_init(&setup.actions);
  if (rc != 0) {
    return spawnFailed(rc);
  }
  setup.actionsInit = true;

  rc = ::posix_spawnattr_init(&setup.attr);
  if (rc != 0) {
    return spawnFailed(rc);
  }
  setup.attrInit = true;

  // dup2 clears O_CLOEXEC on the child's stdout; both pipe ends close on exec
  if ((rc = ::posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null",
                                               O_RDONLY, 0)) != 0 ||
      (rc = ::posix_spawn_file_actions_adddup2(&setup.actions, writeEnd.get(), STDOUT_FILENO)) !=
          0 ||
      (rc = ::posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETPGROUP)) != 0 ||
      (rc = ::posix_spawnattr_setpgroup(&setup.attr, 0)) != 0) {
    return spawnFailed(rc);
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& ARG : argv) {
    cargv.push_back(const_cast<char*>(ARG.c_str()));
  }
  cargv.push_back(nullptr);

  pid_t pid = -1;
  rc = ::posix_spawn(&pid, cargv[0], &setup.actions, &setup.attr, cargv.data(), environ);
  if (rc != 0) {
    return spawnFailed(rc);
  }

  ChildGuard child{pid};
  writeEnd.reset();

  CommandResult result{};
  auto finishTimedOut = [&]() {
    child.killAndReap();
    result.outcome = CommandOutcome::TIMED_OUT;
    result.elapsed =
        std::chrono::duration_cast<milliseconds>(Deadline::Clock::now() - START);
    return result;
  };

  // Drain stdout until EOF
  std::array<char, 4096> buf{};
  while (true) {
    if (deadline.expired()) {
      return finishTimedOut();
    }

    struct pollfd pfd{};
    pfd.fd = readEnd.get();
    pfd.events = POLLIN;
    const int READY = ::poll(&pfd, 1, deadline.pollTimeoutMs(POLL_SLICE));
    if (READY < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (READY == 0) {
      continue;
    }

    const ssize_t N = ::read(readEnd.get(), buf.data(), buf.size());
    if (N > 0) {
      const std::size_t ROOM =
          (result.output.size() < maxOutput) ? (maxOutput - result.output.size()) : 0;
      const std::size_t TAKE = (static_cast<std::size_t>(N) < ROOM) ? static_cast<std::size_t>(N)
                                                                     : ROOM;
      result.output.append(buf.data(), TAKE);
      continue;
    }
    if (N < 0 && errno == EINTR) {
      continue;
    }
    break; // EOF or read error
  }
  readEnd.reset();

  // Wait for exit within the remaining budget
  int status = 0;
  while (!child.tryReap(status)) {
    if (deadline.expired()) {
      return finishTimedOut();
    }
    sleepBriefly();
  }

  if (WIFSIGNALED(status)) {
    result.outcome = CommandOutcome::SIGNALED;
    result.termSignal = WTERMSIG(status);
  } else {
    result.outcome = CommandOutcome::EXITED;
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  }
  result.elapsed = std::chrono::duration_cast<milliseconds>(Deadline::Clock::now() - START);
  return result;
}

} // namespace plugin

} // namespace swapcheck
