/***
 * Name: test_metrics
 * Purpose: Validate the metrics registry: enable gating, counters, timers, and both printers.
 */
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "floability/metrics/metrics.h"

using floability::metrics::Metrics;

TEST(Metrics, DisabledRecordsNothing) {
  Metrics::Enable(false);
  Metrics::Reset();
  Metrics::Count("cleanup.processes", 3);
  { const Metrics::ScopedTimer t(Metrics::Phase::Extract); }
  const auto reg = Metrics::Snapshot();
  EXPECT_TRUE(reg.counters.empty());
  EXPECT_TRUE(reg.durations_ns.empty());
  std::ostringstream out;
  Metrics::PrintMetrics(reg, out);
  EXPECT_TRUE(out.str().empty());
}

TEST(Metrics, CountersAccumulateAndTimersRecord) {
  Metrics::Enable(true);
  Metrics::Reset();
  Metrics::Count("cleanup.processes", 2);
  Metrics::Count("cleanup.processes");
  { const Metrics::ScopedTimer t(Metrics::Phase::Extract); }
  const auto reg = Metrics::Snapshot();
  Metrics::Enable(false);
  EXPECT_EQ(reg.counters.at("cleanup.processes"), 3u);
  ASSERT_EQ(reg.durations_ns.size(), 1u);
  EXPECT_EQ(reg.durations_ns[0].first, Metrics::Phase::Extract);

  std::ostringstream text;
  Metrics::PrintMetrics(reg, text);
  EXPECT_NE(text.str().find("Extract:"), std::string::npos);
  EXPECT_NE(text.str().find("cleanup.processes = 3"), std::string::npos);

  std::ostringstream json;
  Metrics::PrintMetricsJson(reg, json);
  EXPECT_NE(json.str().find("\"phase\": \"Extract\""), std::string::npos);
  EXPECT_NE(json.str().find("\"cleanup.processes\": 3"), std::string::npos);
}

TEST(Metrics, PhaseNames) {
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::Allocate), "Allocate");
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::Supervise), "Supervise");
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::Cleanup), "Cleanup");
}
