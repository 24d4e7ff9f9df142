/***
 * Name: floability::launch::CommandLaunchers::SessionOptions
 * Purpose: Command line for the notebook server.
 * Inputs: SessionRequest
 * Outputs: SpawnOptions running in the run directory, logging to jupyter.log
 * Theory of Operation: With a staged environment the server runs inside it via
 *   "conda run --prefix"; the manager identity is exported either way.
 */
#include "floability/launch/launchers.h"

#include <filesystem>
#include <string>
#include <vector>

namespace floability {
namespace launch {

auto CommandLaunchers::SessionOptions(const SessionRequest& request) const -> process::SpawnOptions {
  process::SpawnOptions options;
  options.label = "jupyter";
  if (request.staged_env_dir) {
    options.argv = {config_.conda_program, "run", "--prefix", *request.staged_env_dir, "--no-capture-output"};
  }
  const std::vector<std::string> server = {config_.jupyter_program, "lab", "--no-browser",
                                           "--port=" + std::to_string(request.port)};
  options.argv.insert(options.argv.end(), server.begin(), server.end());
  if (request.notebook) {
    options.argv.push_back(*request.notebook);
  }
  options.env.push_back(process::EnvVar{config_.identity_variable, request.manager_identity});
  options.working_dir = request.run_dir;
  options.log_path = (std::filesystem::path(request.run_dir) / "jupyter.log").string();
  return options;
}

}  // namespace launch
}  // namespace floability
