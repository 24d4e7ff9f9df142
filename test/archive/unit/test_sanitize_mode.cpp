/***
 * Name: test_sanitize_mode
 * Purpose: Validate permission sanitizing for extracted files and directories.
 */
#include <gtest/gtest.h>
#include "floability/archive/detail/extract.h"

using floability::archive::detail::SanitizeMode;

TEST(SanitizeMode, StripsSpecialBits) {
  EXPECT_EQ(SanitizeMode(04755, false), 0755u);
  EXPECT_EQ(SanitizeMode(02755, true), 0755u);
  EXPECT_EQ(SanitizeMode(01777, true), 0777u);
}

TEST(SanitizeMode, ForcesOwnerAccess) {
  EXPECT_EQ(SanitizeMode(0444, false), 0644u);
  EXPECT_EQ(SanitizeMode(0000, false), 0600u);
  EXPECT_EQ(SanitizeMode(0555, true), 0755u);
  EXPECT_EQ(SanitizeMode(0000, true), 0700u);
}
