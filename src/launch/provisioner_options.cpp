/***
 * Name: floability::launch::CommandLaunchers::ProvisionerOptions
 * Purpose: Command line for the worker factory.
 * Inputs: ProvisionerRequest
 * Outputs: SpawnOptions running in the run directory, logging to vine_factory.log
 * Theory of Operation: The factory connects workers to the manager by name, so the
 *   identity is the only link between the two children.
 */
#include "floability/launch/launchers.h"

#include <filesystem>
#include <string>

namespace floability {
namespace launch {

auto CommandLaunchers::ProvisionerOptions(const ProvisionerRequest& request) const -> process::SpawnOptions {
  process::SpawnOptions options;
  options.label = "vine_factory";
  options.argv = {config_.factory_program,
                  "-T",
                  BatchTypeName(request.batch),
                  "--manager-name",
                  request.manager_identity,
                  "--min-workers",
                  std::to_string(request.min_workers),
                  "--max-workers",
                  std::to_string(request.max_workers),
                  "--cores",
                  std::to_string(request.cores_per_worker)};
  if (request.env_archive) {
    options.argv.push_back("--poncho-env");
    options.argv.push_back(*request.env_archive);
  }
  options.argv.push_back("--scratch-dir");
  options.argv.push_back(request.run_dir);
  options.working_dir = request.run_dir;
  options.log_path = (std::filesystem::path(request.run_dir) / "vine_factory.log").string();
  return options;
}

}  // namespace launch
}  // namespace floability
