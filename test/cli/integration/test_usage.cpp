/***
 * Name: test_usage
 * Purpose: Validate PrintUsage() content exposes documented sub-commands and flags.
 */
#include <gtest/gtest.h>
#include <sstream>
#include "floability/driver/cli.h"

using namespace floability::driver;

TEST(CLI_Usage, ContainsExpectedFlags) {
  std::ostringstream out;
  PrintUsage(out, "/usr/local/bin/floability");
  const auto u = out.str();
  EXPECT_NE(u.find("Usage: floability run [options]"), std::string::npos);
  EXPECT_NE(u.find("floability fetch --data-spec"), std::string::npos);
  for (const char* flag : {"--environment", "--notebook", "--batch-type", "--workers", "--cores-per-worker",
                           "--manager-name", "--jupyter-port", "--base-dir", "--data-spec", "--backpack-root",
                           "--poll-interval", "--grace-period", "--verbose", "--metrics"}) {
    EXPECT_NE(u.find(flag), std::string::npos) << flag;
  }
}

TEST(CLI_Usage, NullArgv0FallsBackToName) {
  std::ostringstream out;
  PrintUsage(out, nullptr);
  EXPECT_NE(out.str().find("Usage: floability run"), std::string::npos);
}
