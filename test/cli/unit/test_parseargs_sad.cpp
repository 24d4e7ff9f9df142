/***
 * Name: test_parseargs_sad
 * Purpose: Exercise sad-path CLI parsing for invalid/missing/unknown cases.
 */
#include <gtest/gtest.h>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>
#include "floability/driver/cli.h"

using namespace floability::driver;

static bool Parse(std::initializer_list<const char*> args, std::string* diag = nullptr) {
  std::vector<const char*> argv(args);
  RunOptions o; std::ostringstream err;
  const bool ok = ParseCli(static_cast<int>(argv.size()), argv.data(), o, err);
  if (diag != nullptr) *diag = err.str();
  return ok;
}

TEST(CLI_Sad, NoSubCommand) {
  std::string diag;
  EXPECT_FALSE(Parse({"floability"}, &diag));
  EXPECT_NE(diag.find("no sub-command"), std::string::npos);
}

TEST(CLI_Sad, UnknownSubCommand) {
  std::string diag;
  EXPECT_FALSE(Parse({"floability", "launch"}, &diag));
  EXPECT_NE(diag.find("unknown sub-command 'launch'"), std::string::npos);
}

TEST(CLI_Sad, UnknownOption) {
  std::string diag;
  EXPECT_FALSE(Parse({"floability", "run", "--unknown"}, &diag));
  EXPECT_NE(diag.find("unknown option '--unknown'"), std::string::npos);
}

TEST(CLI_Sad, StrayPositional) {
  EXPECT_FALSE(Parse({"floability", "run", "notebook.ipynb"}));
}

TEST(CLI_Sad, MissingValue) {
  std::string diag;
  EXPECT_FALSE(Parse({"floability", "run", "--workers"}, &diag));
  EXPECT_NE(diag.find("missing value after '--workers'"), std::string::npos);
}

TEST(CLI_Sad, NonNumericWorkers) {
  EXPECT_FALSE(Parse({"floability", "run", "--workers", "five"}));
  EXPECT_FALSE(Parse({"floability", "run", "--workers=12abc"}));
}

TEST(CLI_Sad, OutOfRangeValues) {
  EXPECT_FALSE(Parse({"floability", "run", "--workers", "0"}));
  EXPECT_FALSE(Parse({"floability", "run", "--cores-per-worker", "-1"}));
  EXPECT_FALSE(Parse({"floability", "run", "--jupyter-port", "70000"}));
  EXPECT_FALSE(Parse({"floability", "run", "--poll-interval", "0"}));
  EXPECT_FALSE(Parse({"floability", "run", "--grace-period", "-3"}));
}

TEST(CLI_Sad, RangeReportedWithValue) {
  std::string diag;
  EXPECT_FALSE(Parse({"floability", "run", "--jupyter-port", "0"}, &diag));
  EXPECT_NE(diag.find("invalid value '0' for --jupyter-port: must be between 1 and 65535"), std::string::npos);
  EXPECT_FALSE(Parse({"floability", "run", "--workers", "99999999999999999999"}, &diag));
  EXPECT_NE(diag.find("must be at least 1"), std::string::npos);
}

TEST(CLI_Sad, SignsAndPaddingRejected) {
  EXPECT_FALSE(Parse({"floability", "run", "--workers", "+3"}));
  EXPECT_FALSE(Parse({"floability", "run", "--workers", " 3"}));
  EXPECT_FALSE(Parse({"floability", "run", "--workers", "3 "}));
  EXPECT_FALSE(Parse({"floability", "run", "--workers", ""}));
}

TEST(CLI_Sad, BadDurations) {
  std::string diag;
  EXPECT_FALSE(Parse({"floability", "run", "--poll-interval", "50ms"}, &diag));
  EXPECT_NE(diag.find("must be at least 100ms"), std::string::npos);
  EXPECT_FALSE(Parse({"floability", "run", "--grace-period", "5m"}));
  EXPECT_FALSE(Parse({"floability", "run", "--grace-period", "ms"}));
  EXPECT_FALSE(Parse({"floability", "run", "--poll-interval", "9999999999s"}));
}

TEST(CLI_Sad, UnknownBatchType) {
  std::string diag;
  EXPECT_FALSE(Parse({"floability", "run", "--batch-type", "pbs"}, &diag));
  EXPECT_NE(diag.find("unknown batch type 'pbs'"), std::string::npos);
}

TEST(CLI_Sad, EmptyEnvironment) {
  EXPECT_FALSE(Parse({"floability", "run", "--environment="}));
}

TEST(CLI_Sad, FetchWithoutDataSpec) {
  std::string diag;
  EXPECT_FALSE(Parse({"floability", "fetch"}, &diag));
  EXPECT_NE(diag.find("fetch requires --data-spec"), std::string::npos);
}

TEST(CLI_Sad, BadMetricsFormat) {
  EXPECT_FALSE(Parse({"floability", "run", "--metrics=xml"}));
}
