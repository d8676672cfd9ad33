/**
 * @file Command_uTest.cpp
 * @brief Unit tests for swapcheck::plugin::runCommand.
 *
 * Notes:
 *  - Runs throwaway /bin/sh scripts created in a mkdtemp() directory.
 *  - Timeout tests use short budgets; assertions allow generous slack.
 */

#include "src/plugin/inc/Command.hpp"

#include <gtest/gtest.h>

#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using swapcheck::plugin::CommandOutcome;
using swapcheck::plugin::CommandResult;
using swapcheck::plugin::Deadline;
using swapcheck::plugin::formatCommand;
using swapcheck::plugin::KILL_GRACE;
using swapcheck::plugin::killGroupAndReap;
using swapcheck::plugin::runCommand;
using std::chrono::milliseconds;

class CommandTest : public ::testing::Test {
protected:
  std::string dir_{};
  std::vector<std::string> created_{};

  void SetUp() override {
    char tmpl[] = "/tmp/swapcheck-cmd-XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
  }

  void TearDown() override {
    for (const std::string& P : created_) {
      ::unlink(P.c_str());
    }
    ::rmdir(dir_.c_str());
  }

  /// Write an executable shell script and return its path.
  std::string script(const std::string& name, const std::string& body) {
    const std::string PATH = dir_ + "/" + name;
    std::FILE* f = std::fopen(PATH.c_str(), "w");
    EXPECT_NE(f, nullptr);
    if (f == nullptr) {
      return PATH;
    }
    std::fputs("#!/bin/sh\n", f);
    std::fputs(body.c_str(), f);
    std::fclose(f);
    EXPECT_EQ(::chmod(PATH.c_str(), 0755), 0);
    created_.push_back(PATH);
    return PATH;
  }
};

/* ----------------------------- Normal Runs ----------------------------- */

/** @test Stdout is captured and exit status 0 reported. */
TEST_F(CommandTest, CapturesOutput) {
  const std::string S = script("ok.sh", "echo first\necho second\n");
  const CommandResult R = runCommand({S}, Deadline::after(std::chrono::seconds{10}));
  EXPECT_EQ(R.outcome, CommandOutcome::EXITED);
  EXPECT_EQ(R.exitCode, 0);
  EXPECT_TRUE(R.succeeded());
  EXPECT_EQ(R.output, "first\nsecond\n");
}

/** @test Arguments are passed through unchanged. */
TEST_F(CommandTest, PassesArguments) {
  const std::string S = script("args.sh", "echo \"$1|$2\"\n");
  const CommandResult R = runCommand({S, "-k", "two words"}, Deadline{});
  EXPECT_EQ(R.output, "-k|two words\n");
}

/** @test Non-zero exit status is reported, not treated as spawn failure. */
TEST_F(CommandTest, ExitStatus) {
  const std::string S = script("fail.sh", "echo partial\nexit 3\n");
  const CommandResult R = runCommand({S}, Deadline{});
  EXPECT_EQ(R.outcome, CommandOutcome::EXITED);
  EXPECT_EQ(R.exitCode, 3);
  EXPECT_EQ(R.statusCode(), 3);
  EXPECT_FALSE(R.succeeded());
  EXPECT_EQ(R.output, "partial\n");
}

/** @test Stdin is /dev/null, so readers see EOF immediately. */
TEST_F(CommandTest, StdinIsDevNull) {
  const std::string S = script("cat.sh", "cat\necho done\n");
  const CommandResult R = runCommand({S}, Deadline::after(std::chrono::seconds{10}));
  EXPECT_EQ(R.outcome, CommandOutcome::EXITED);
  EXPECT_EQ(R.output, "done\n");
}

/** @test Termination by signal. */
TEST_F(CommandTest, Signaled) {
  const std::string S = script("kill.sh", "kill -TERM $$\n");
  const CommandResult R = runCommand({S}, Deadline::after(std::chrono::seconds{10}));
  EXPECT_EQ(R.outcome, CommandOutcome::SIGNALED);
  EXPECT_EQ(R.termSignal, SIGTERM);
  EXPECT_EQ(R.statusCode(), 128 + SIGTERM);
}

/** @test Output beyond the cap is discarded. */
TEST_F(CommandTest, OutputCap) {
  const std::string S = script("big.sh", "echo 0123456789\necho 0123456789\n");
  const CommandResult R = runCommand({S}, Deadline{}, 5);
  EXPECT_EQ(R.outcome, CommandOutcome::EXITED);
  EXPECT_EQ(R.output, "01234");
}

/* ----------------------------- Failures ----------------------------- */

/** @test Missing program is a spawn failure. */
TEST_F(CommandTest, SpawnFailure) {
  const CommandResult R = runCommand({dir_ + "/does-not-exist"}, Deadline{});
  EXPECT_EQ(R.outcome, CommandOutcome::SPAWN_FAILED);
  EXPECT_NE(R.spawnErrno, 0);
  EXPECT_EQ(R.statusCode(), -1);
}

/** @test Empty argv is rejected. */
TEST_F(CommandTest, EmptyArgv) {
  const CommandResult R = runCommand({}, Deadline{});
  EXPECT_EQ(R.outcome, CommandOutcome::SPAWN_FAILED);
}

/** @test A hung child is killed when the deadline expires. */
TEST_F(CommandTest, TimesOut) {
  const std::string S = script("hang.sh", "echo started\nsleep 30\n");
  const auto START = std::chrono::steady_clock::now();
  const CommandResult R = runCommand({S}, Deadline::after(milliseconds{300}));
  const auto TOOK = std::chrono::steady_clock::now() - START;

  EXPECT_EQ(R.outcome, CommandOutcome::TIMED_OUT);
  EXPECT_LT(TOOK, std::chrono::seconds{10});
}

/** @test A child that closes stdout but keeps running still times out. */
TEST_F(CommandTest, TimesOutAfterStdoutClosed) {
  const std::string S = script("linger.sh", "exec >/dev/null\nsleep 30\n");
  const CommandResult R = runCommand({S}, Deadline::after(milliseconds{300}));
  EXPECT_EQ(R.outcome, CommandOutcome::TIMED_OUT);
}

/* ----------------------------- Child Cleanup ----------------------------- */

/** @test A process-group leader is killed and reaped. */
TEST(CommandKillTest, ReapsGroupLeader) {
  const pid_t PID = ::fork();
  ASSERT_GE(PID, 0);
  if (PID == 0) {
    ::setpgid(0, 0);
    ::pause();
    ::_exit(0);
  }
  ::setpgid(PID, PID);

  EXPECT_TRUE(killGroupAndReap(PID, std::chrono::seconds{5}));
  int status = 0;
  EXPECT_LT(::waitpid(PID, &status, WNOHANG), 0);
}

/** @test A child that survives the kill is abandoned after the grace period. */
TEST(CommandKillTest, GivesUpAfterGrace) {
  // No process group of its own, so the group SIGKILL misses it
  const pid_t PID = ::fork();
  ASSERT_GE(PID, 0);
  if (PID == 0) {
    ::pause();
    ::_exit(0);
  }

  const auto START = std::chrono::steady_clock::now();
  const bool REAPED = killGroupAndReap(PID, KILL_GRACE);
  const auto TOOK = std::chrono::steady_clock::now() - START;

  EXPECT_FALSE(REAPED);
  EXPECT_GE(TOOK, KILL_GRACE);
  EXPECT_LT(TOOK, std::chrono::seconds{2});

  ::kill(PID, SIGKILL);
  int status = 0;
  EXPECT_EQ(::waitpid(PID, &status, 0), PID);
}

/* ----------------------------- Formatting ----------------------------- */

/** @test Command line rendering for messages. */
TEST(CommandFormatTest, FormatCommand) {
  EXPECT_EQ(formatCommand({"/usr/sbin/swapinfo", "-k"}), "/usr/sbin/swapinfo -k");
  EXPECT_EQ(formatCommand({}), "");
}
