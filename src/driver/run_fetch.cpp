/***
 * Name: floability::driver::RunFetch
 * Purpose: Fetch backpack data without starting a session.
 * Inputs: opts, fetcher
 * Outputs: kExitOk, or kExitAbort after logging the failure
 */
#include "floability/driver/app.h"

#include <string>

#include "floability/exceptions/floability_exception.h"
#include "floability/support/log.h"

namespace floability::driver {

auto RunFetch(const RunOptions& opts, launch::DataFetcher& fetcher) -> int {
  if (!opts.data_spec) {
    support::Log(support::LogLevel::Error, "floability", "no data spec provided; use --data-spec path/to/data.yml");
    return kExitUsage;
  }
  try {
    fetcher.Fetch(*opts.data_spec, opts.backpack_root);
  } catch (const exceptions::FloabilityException& e) {
    support::Log(support::LogLevel::Error, "floability", std::string("data fetch failed: ") + e.what());
    return kExitAbort;
  }
  support::Log(support::LogLevel::Info, "floability", "data fetched into " + opts.backpack_root);
  return kExitOk;
}

}  // namespace floability::driver
