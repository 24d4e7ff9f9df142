/***
 * Name: floability::launch::CommandMaterializer::Materialize
 * Purpose: Build a packed environment from a declarative description.
 * Inputs: description path, manager identity (unused by the tool), run_dir
 * Outputs: Path of <run_dir>/environment.tar.gz; throws EnvironmentBuildError
 */
#include "floability/launch/collaborators.h"

#include <filesystem>
#include <string>

#include "floability/exceptions/environment_build_error.h"
#include "floability/metrics/metrics.h"
#include "floability/process/command.h"
#include "floability/support/log.h"

namespace floability {
namespace launch {

auto CommandMaterializer::Materialize(const std::string& description, const std::string& /*manager_identity*/,
                                      const std::string& run_dir) -> std::string {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Materialize);
  const std::string archive = (std::filesystem::path(run_dir) / "environment.tar.gz").string();
  support::Log(support::LogLevel::Info, "launch", "building environment from " + description);

  process::CommandOptions options;
  options.argv = {program_, description, archive};
  options.working_dir = run_dir;
  const process::CommandResult result = process::RunCommand(options);
  if (!result.started) {
    throw exceptions::EnvironmentBuildError("cannot run " + program_ + ": " + result.error);
  }
  if (result.exit_code != 0) {
    throw exceptions::EnvironmentBuildError(program_ + " failed with status " + std::to_string(result.exit_code) +
                                            (result.output.empty() ? std::string() : ":\n" + result.output));
  }
  return archive;
}

}  // namespace launch
}  // namespace floability
