/***
 * Name: floability::supervise::SupervisionLoop
 * Purpose: Poll the provisioner and the interactive session until the session ends.
 * Inputs: Registry, both process handles, poll interval, optional sleeper
 * Outputs: SupervisionResult; cleanup has always run when Run() returns
 * Theory of Operation: Running -> ProvisionerExited ends the loop. Running ->
 *   SessionExited only records the fact: the provisioner may still be serving
 *   workers, so polling continues until it exits too. An interruption (cleanup
 *   already started elsewhere, normally by the signal bridge) also ends the loop.
 *   Every exit path goes through Done, which calls Cleanup() once.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include "floability/cleanup/registry.h"
#include "floability/process/handle.h"

namespace floability {
namespace supervise {

constexpr std::chrono::milliseconds kDefaultPollInterval{5000};

enum class SupervisionState { Running, ProvisionerExited, SessionExited, Done };

enum class SupervisionOutcome { ProvisionerExited, Interrupted };

struct SupervisionResult {
  SupervisionOutcome outcome{SupervisionOutcome::ProvisionerExited};
  bool session_exited{false};
  std::size_t polls{0};
  cleanup::CleanupReport cleanup;
};

const char* StateName(SupervisionState state);

class SupervisionLoop {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  SupervisionLoop(cleanup::CleanupRegistry& registry, std::shared_ptr<process::ProcessHandle> provisioner,
                  std::shared_ptr<process::ProcessHandle> session,
                  std::chrono::milliseconds interval = kDefaultPollInterval, Sleeper sleeper = nullptr);

  SupervisionResult Run();

  SupervisionState state() const { return state_; }

 private:
  void DefaultSleep(std::chrono::milliseconds interval) const;
  void Transition(SupervisionState next);

  cleanup::CleanupRegistry& registry_;
  std::shared_ptr<process::ProcessHandle> provisioner_;
  std::shared_ptr<process::ProcessHandle> session_;
  std::chrono::milliseconds interval_;
  Sleeper sleeper_;
  SupervisionState state_{SupervisionState::Running};
};

}  // namespace supervise
}  // namespace floability
