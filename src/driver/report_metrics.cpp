/***
 * Name: floability::driver::ReportMetricsIfRequested
 * Purpose: Print metrics to stdout if enabled by CLI.
 * Inputs:
 *   - opts: options containing metrics flags
 * Outputs: None
 * Theory of Operation: Reads Metrics registry and prints text or JSON.
 */
#include "floability/driver/app.h"
#include "floability/metrics/metrics.h"

#include <iostream>

namespace floability::driver {

auto ReportMetricsIfRequested(const RunOptions& opts) -> void {
  if (!opts.metrics) {
    return;
  }
  const auto reg = metrics::Metrics::Snapshot();
  if (opts.metrics_format == RunOptions::MetricsFormat::Json) {
    metrics::Metrics::PrintMetricsJson(reg, std::cout);
  } else {
    metrics::Metrics::PrintMetrics(reg, std::cout);
  }
}

}  // namespace floability::driver
