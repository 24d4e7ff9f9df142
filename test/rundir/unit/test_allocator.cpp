/***
 * Name: test_allocator
 * Purpose: Validate run directory allocation: uniqueness, placement, and failures.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "floability/exceptions/allocation_error.h"
#include "floability/rundir/allocator.h"
#include "util/TempDir.h"

namespace fs = std::filesystem;
using floability::rundir::AllocateRunDirectory;

TEST(RunDirAllocator, CreatesFreshDirectoryUnderBase) {
  testutil::TempDir base("floability_rundir");
  const auto dir = AllocateRunDirectory(base.path(), "floability_run");
  EXPECT_TRUE(fs::is_directory(dir));
  EXPECT_TRUE(fs::is_empty(dir));
  EXPECT_EQ(fs::path(dir).parent_path(), fs::canonical(base.path()));
  EXPECT_EQ(fs::path(dir).filename().string().rfind("floability_run_", 0), 0u);
}

TEST(RunDirAllocator, ThousandCallsAreDistinct) {
  testutil::TempDir base("floability_rundir");
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    ASSERT_TRUE(seen.insert(AllocateRunDirectory(base.path(), "floability_run")).second);
  }
  EXPECT_EQ(seen.size(), 1000u);
}

TEST(RunDirAllocator, ConcurrentCallersNeverShare) {
  testutil::TempDir base("floability_rundir");
  constexpr int kThreads = 8;
  constexpr int kEach = 50;
  std::vector<std::vector<std::string>> results(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kEach; ++i) results[t].push_back(AllocateRunDirectory(base.path(), "floability_run"));
    });
  }
  for (auto& th : threads) th.join();
  std::set<std::string> all;
  for (const auto& r : results) all.insert(r.begin(), r.end());
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kEach));
}

TEST(RunDirAllocator, MissingBaseFails) {
  testutil::TempDir base("floability_rundir");
  EXPECT_THROW(AllocateRunDirectory(base / "missing", "floability_run"), floability::exceptions::AllocationError);
}

TEST(RunDirAllocator, FileAsBaseFails) {
  testutil::TempDir base("floability_rundir");
  const auto file = base / "plain";
  { std::FILE* f = std::fopen(file.c_str(), "w"); ASSERT_NE(f, nullptr); std::fclose(f); }
  EXPECT_THROW(AllocateRunDirectory(file, "floability_run"), floability::exceptions::AllocationError);
}

TEST(RunDirAllocator, PrefixWithSlashFails) {
  testutil::TempDir base("floability_rundir");
  EXPECT_THROW(AllocateRunDirectory(base.path(), "a/b"), floability::exceptions::AllocationError);
}
