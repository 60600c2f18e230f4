#include "core/ProcessRunner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <string>
#include <thread>

#include "common/Errors.hpp"
#include "support/TempDir.hpp"

using ferry::common::LaunchError;
using ferry::core::ProcessResult;
using ferry::core::ProcessRunner;
using ferry::core::ProcessSpec;
using ferry::test::TempDir;
using ferry::test::readText;
namespace fs = std::filesystem;

namespace {

ProcessSpec shell(const std::string& sScript, const fs::path& pathLog,
                  std::chrono::seconds durTimeout = std::chrono::seconds(0)) {
  ProcessSpec ps;
  ps.sCommand = "/bin/sh";
  ps.vArgs = {"-c", sScript};
  ps.pathLog = pathLog;
  ps.durTimeout = durTimeout;
  return ps;
}

}  // namespace

class ProcessRunnerTest : public ::testing::Test {
 protected:
  TempDir _td;
  ProcessRunner _pr;
  fs::path logPath() const { return _td.path() / "run.log"; }
};

TEST_F(ProcessRunnerTest, ZeroExit) {
  auto pres = _pr.run(shell("true", logPath()));
  EXPECT_EQ(pres.iExitCode, 0);
  EXPECT_FALSE(pres.bTimedOut);
}

TEST_F(ProcessRunnerTest, NonZeroExitIsReturnedNotThrown) {
  auto pres = _pr.run(shell("exit 3", logPath()));
  EXPECT_EQ(pres.iExitCode, 3);
}

TEST_F(ProcessRunnerTest, StdoutAndStderrShareTheLog) {
  _pr.run(shell("echo to-stdout; echo to-stderr 1>&2", logPath()));
  const auto sLog = readText(logPath());
  EXPECT_NE(sLog.find("to-stdout"), std::string::npos);
  EXPECT_NE(sLog.find("to-stderr"), std::string::npos);
}

TEST_F(ProcessRunnerTest, ArgumentsPassedVerbatim) {
  ProcessSpec ps;
  ps.sCommand = "/bin/sh";
  ps.vArgs = {"-c", "printf '%s|' \"$@\"", "sh", "a b", "", "@c"};
  ps.pathLog = logPath();
  _pr.run(ps);
  EXPECT_EQ(readText(logPath()), "a b||@c|");
}

TEST_F(ProcessRunnerTest, ExistingLogIsTruncated) {
  ferry::test::writeText(logPath(), "stale output from an earlier run\n");
  _pr.run(shell("echo fresh", logPath()));
  EXPECT_EQ(readText(logPath()), "fresh\n");
}

TEST_F(ProcessRunnerTest, MissingBinaryIsLaunchError) {
  ProcessSpec ps;
  ps.sCommand = (_td.path() / "no-such-tool").string();
  ps.pathLog = logPath();
  EXPECT_THROW(_pr.run(ps), LaunchError);
}

TEST_F(ProcessRunnerTest, NonExecutableFileIsLaunchError) {
  const auto pathTool = _td.path() / "not-executable";
  ferry::test::writeText(pathTool, "#!/bin/sh\nexit 0\n");
  fs::permissions(pathTool, fs::perms::owner_read | fs::perms::owner_write);

  ProcessSpec ps;
  ps.sCommand = pathTool.string();
  ps.pathLog = logPath();
  EXPECT_THROW(_pr.run(ps), LaunchError);
}

TEST_F(ProcessRunnerTest, EmptyCommandIsLaunchError) {
  ProcessSpec ps;
  ps.pathLog = logPath();
  EXPECT_THROW(_pr.run(ps), LaunchError);
}

TEST_F(ProcessRunnerTest, UnwritableLogIsLaunchError) {
  EXPECT_THROW(_pr.run(shell("true", _td.path() / "missing-dir" / "run.log")), LaunchError);
}

TEST_F(ProcessRunnerTest, SignalExitMapsAbove128) {
  auto pres = _pr.run(shell("kill -TERM $$", logPath()));
  EXPECT_EQ(pres.iExitCode, 128 + 15);
  EXPECT_FALSE(pres.bTimedOut);
}

TEST_F(ProcessRunnerTest, TimeoutKillsProcessTree) {
  const auto tpStart = std::chrono::steady_clock::now();
  auto pres = _pr.run(shell("echo started; sleep 30; echo never", logPath(),
                            std::chrono::seconds(1)));
  const auto durElapsed = std::chrono::steady_clock::now() - tpStart;

  EXPECT_TRUE(pres.bTimedOut);
  EXPECT_NE(pres.iExitCode, 0);
  EXPECT_LT(durElapsed, std::chrono::seconds(10));

  const auto sLog = readText(logPath());
  EXPECT_NE(sLog.find("started"), std::string::npos);
  EXPECT_EQ(sLog.find("never"), std::string::npos);
}

TEST_F(ProcessRunnerTest, OutputVisibleWhileRunning) {
  const auto pathGo = _td.path() / "go";
  const std::string sScript = "echo first; i=0; while [ ! -e '" + pathGo.string() +
                              "' ] && [ $i -lt 200 ]; do sleep 0.05; i=$((i+1)); done; "
                              "echo second";
  auto futRun = std::async(std::launch::async,
                           [this, &sScript]() { return _pr.run(shell(sScript, logPath())); });

  bool bSawFirst = false;
  for (int i = 0; i < 100 && !bSawFirst; ++i) {
    bSawFirst = readText(logPath()).find("first") != std::string::npos;
    if (!bSawFirst) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }
  EXPECT_TRUE(bSawFirst);
  EXPECT_EQ(readText(logPath()).find("second"), std::string::npos);

  ferry::test::writeText(pathGo, "");
  EXPECT_EQ(futRun.get().iExitCode, 0);
  EXPECT_NE(readText(logPath()).find("second"), std::string::npos);
}
