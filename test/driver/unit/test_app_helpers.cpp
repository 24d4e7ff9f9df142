/***
 * Name: test_app_helpers
 * Purpose: Validate archive-path classification, the fetch entry point, and metrics reporting.
 */
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>
#include "floability/driver/app.h"
#include "floability/exceptions/data_fetch_error.h"
#include "floability/metrics/metrics.h"
#include "floability/support/log.h"
#include "util/Fakes.h"

using namespace floability::driver;

namespace {

class FailingFetcher final : public floability::launch::DataFetcher {
 public:
  void Fetch(const std::string&, const std::string&) override {
    throw floability::exceptions::DataFetchError("floability-data-fetch failed with status 1");
  }
};

}  // namespace

TEST(IsArchivePath, RecognizedSuffixes) {
  for (const char* p : {"env.tar.gz", "env.tgz", "/x/env.tar.bz2", "env.tbz2", "env.tar.xz", "env.txz", "env.tar"}) {
    EXPECT_TRUE(IsArchivePath(p)) << p;
  }
}

TEST(IsArchivePath, DescriptionsAndBareSuffixes) {
  for (const char* p : {"environment.yml", "env.zip", "env.gz", ".tar.gz", "tar", "", "env.tar.gz.yml"}) {
    EXPECT_FALSE(IsArchivePath(p)) << p;
  }
}

TEST(RunFetch, CallsFetcher) {
  RunOptions opts;
  opts.command = RunOptions::Command::Fetch;
  opts.data_spec = "data.yml";
  opts.backpack_root = "/bp";
  testutil::FakeDataFetcher fetcher;
  std::ostringstream log;
  floability::support::SetLogStream(&log);
  EXPECT_EQ(RunFetch(opts, fetcher), kExitOk);
  floability::support::SetLogStream(nullptr);
  EXPECT_EQ(fetcher.calls, 1);
  EXPECT_EQ(fetcher.last_spec, "data.yml");
  EXPECT_EQ(fetcher.last_root, "/bp");
}

TEST(RunFetch, MissingSpecIsUsageError) {
  RunOptions opts;
  testutil::FakeDataFetcher fetcher;
  std::ostringstream log;
  floability::support::SetLogStream(&log);
  EXPECT_EQ(RunFetch(opts, fetcher), kExitUsage);
  floability::support::SetLogStream(nullptr);
  EXPECT_EQ(fetcher.calls, 0);
  EXPECT_NE(log.str().find("--data-spec"), std::string::npos);
}

TEST(RunFetch, FailureIsAbort) {
  RunOptions opts;
  opts.data_spec = "data.yml";
  FailingFetcher fetcher;
  std::ostringstream log;
  floability::support::SetLogStream(&log);
  EXPECT_EQ(RunFetch(opts, fetcher), kExitAbort);
  floability::support::SetLogStream(nullptr);
  EXPECT_NE(log.str().find("data fetch failed"), std::string::npos);
}

TEST(ReportMetrics, JsonWhenRequested) {
  using floability::metrics::Metrics;
  Metrics::Enable(true);
  Metrics::Reset();
  Metrics::Count("process.spawned", 2);
  { const Metrics::ScopedTimer t(Metrics::Phase::Cleanup); }
  RunOptions opts;
  opts.metrics = true;
  opts.metrics_format = RunOptions::MetricsFormat::Json;
  std::ostringstream captured;
  auto* old = std::cout.rdbuf(captured.rdbuf());
  ReportMetricsIfRequested(opts);
  std::cout.rdbuf(old);
  Metrics::Enable(false);
  const auto out = captured.str();
  EXPECT_NE(out.find("\"process.spawned\": 2"), std::string::npos);
  EXPECT_NE(out.find("\"phase\": \"Cleanup\""), std::string::npos);
}
