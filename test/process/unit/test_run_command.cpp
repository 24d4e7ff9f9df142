/***
 * Name: test_run_command
 * Purpose: Validate RunCommand output capture, exit codes, and start failures.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>
#include "floability/process/command.h"
#include "floability/process/detail/exec.h"
#include "util/TempDir.h"

using namespace floability::process;

TEST(RunCommand, CapturesStdoutAndStderr) {
  CommandOptions o;
  o.argv = {"sh", "-c", "echo out; echo err >&2; exit 0"};
  const auto r = RunCommand(o);
  EXPECT_TRUE(r.started);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.output.find("out\n"), std::string::npos);
  EXPECT_NE(r.output.find("err\n"), std::string::npos);
}

TEST(RunCommand, ReportsExitCode) {
  CommandOptions o;
  o.argv = {"sh", "-c", "exit 42"};
  const auto r = RunCommand(o);
  EXPECT_TRUE(r.started);
  EXPECT_EQ(r.exit_code, 42);
}

TEST(RunCommand, SignalDeathIs128PlusSignal) {
  CommandOptions o;
  o.argv = {"sh", "-c", "kill -TERM $$"};
  EXPECT_EQ(RunCommand(o).exit_code, 128 + SIGTERM);
}

TEST(RunCommand, LargeOutputDoesNotDeadlock) {
  CommandOptions o;
  o.argv = {"sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line-$i; i=$((i+1)); done"};
  const auto r = RunCommand(o);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.output.find("line-19999"), std::string::npos);
}

TEST(RunCommand, MissingProgramNotStarted) {
  CommandOptions o;
  o.argv = {"floability-no-such-helper"};
  const auto r = RunCommand(o);
  EXPECT_FALSE(r.started);
  EXPECT_FALSE(r.error.empty());
}

TEST(RunCommand, EmptyArgvNotStarted) {
  const auto r = RunCommand(CommandOptions{});
  EXPECT_FALSE(r.started);
}

TEST(RunCommand, WorkingDirectoryAndEnvironment) {
  testutil::TempDir dir("floability_cmd");
  CommandOptions o;
  o.argv = {"sh", "-c", "pwd -P; echo \"v=$FLOABILITY_TEST_VAR\""};
  o.working_dir = dir.path();
  o.env = {{"FLOABILITY_TEST_VAR", "42"}};
  const auto r = RunCommand(o);
  EXPECT_NE(r.output.find(std::filesystem::canonical(dir.path()).string()), std::string::npos);
  EXPECT_NE(r.output.find("v=42"), std::string::npos);
}

TEST(ExecHelpers, OverrideReplacesInheritedValue) {
  ::setenv("FLOABILITY_OVERRIDE_ME", "old", 1);
  const auto env = detail::BuildEnvironment({{"FLOABILITY_OVERRIDE_ME", "new"}, {"FLOABILITY_ADDED", "1"}});
  int hits = 0;
  for (const auto& kv : env) {
    if (kv.rfind("FLOABILITY_OVERRIDE_ME=", 0) == 0) {
      ++hits;
      EXPECT_EQ(kv, "FLOABILITY_OVERRIDE_ME=new");
    }
  }
  EXPECT_EQ(hits, 1);
  EXPECT_NE(std::find(env.begin(), env.end(), "FLOABILITY_ADDED=1"), env.end());
  ::unsetenv("FLOABILITY_OVERRIDE_ME");
}

TEST(ExecHelpers, DescribeCommandJoinsArgs) {
  EXPECT_EQ(detail::DescribeCommand({"vine_factory", "-T", "local"}), "vine_factory -T local");
}

TEST(ExecHelpers, BuildArgvIsNullTerminated) {
  std::vector<std::string> args{"a", "b"};
  const auto argv = detail::BuildArgvMutable(args);
  ASSERT_EQ(argv.size(), 3u);
  EXPECT_STREQ(argv[0], "a");
  EXPECT_EQ(argv[2], nullptr);
}
