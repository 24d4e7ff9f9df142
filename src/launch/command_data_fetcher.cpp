/***
 * Name: floability::launch::CommandDataFetcher::Fetch
 * Purpose: Fetch backpack input data with an external helper.
 * Inputs: spec_path, root_path
 * Outputs: none; throws DataFetchError with the helper's output on failure
 */
#include "floability/launch/collaborators.h"

#include <string>

#include "floability/exceptions/data_fetch_error.h"
#include "floability/metrics/metrics.h"
#include "floability/process/command.h"
#include "floability/support/log.h"

namespace floability {
namespace launch {

auto CommandDataFetcher::Fetch(const std::string& spec_path, const std::string& root_path) -> void {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::FetchData);
  support::Log(support::LogLevel::Info, "launch", "fetching data described by " + spec_path);

  process::CommandOptions options;
  options.argv = {program_, "--data-spec", spec_path, "--backpack-root", root_path};
  const process::CommandResult result = process::RunCommand(options);
  if (!result.started) {
    throw exceptions::DataFetchError("cannot run " + program_ + ": " + result.error);
  }
  if (result.exit_code != 0) {
    throw exceptions::DataFetchError(program_ + " failed with status " + std::to_string(result.exit_code) +
                                     (result.output.empty() ? std::string() : ":\n" + result.output));
  }
}

}  // namespace launch
}  // namespace floability
