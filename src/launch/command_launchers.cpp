/***
 * Name: floability::launch::CommandLaunchers
 * Purpose: Spawn the provisioner and the notebook server as real child processes.
 * Inputs: Requests
 * Outputs: ChildProcess handles; SpawnError propagates from ChildProcess::Spawn
 */
#include "floability/launch/launchers.h"

#include <memory>
#include <string>

#include "floability/support/log.h"

namespace floability {
namespace launch {

auto CommandLaunchers::LaunchProvisioner(const ProvisionerRequest& request)
    -> std::shared_ptr<process::ProcessHandle> {
  support::Log(support::LogLevel::Info, "launch",
               std::string("starting vine_factory (") + BatchTypeName(request.batch) + ", up to " +
                   std::to_string(request.max_workers) + " workers)");
  return process::ChildProcess::Spawn(ProvisionerOptions(request));
}

auto CommandLaunchers::LaunchSession(const SessionRequest& request) -> std::shared_ptr<process::ProcessHandle> {
  support::Log(support::LogLevel::Info, "launch", "starting jupyter lab on port " + std::to_string(request.port));
  return process::ChildProcess::Spawn(SessionOptions(request));
}

}  // namespace launch
}  // namespace floability
