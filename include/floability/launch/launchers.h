/***
 * Name: floability::launch (launchers)
 * Purpose: Start the two long-lived session children: the worker provisioner and
 *   the interactive notebook server.
 * Inputs: ProvisionerRequest / SessionRequest
 * Outputs: ProcessHandle for the started child; SpawnError if it cannot start
 * Theory of Operation: SessionLaunchers is the seam the session driver depends on,
 *   so tests can substitute fakes. CommandLaunchers builds the vine_factory and
 *   jupyter command lines and spawns them with their output in the run directory.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "floability/process/handle.h"

namespace floability {
namespace launch {

enum class BatchType { Local, Condor, Uge, Slurm };

const char* BatchTypeName(BatchType type);
/*** ParseBatchType: Accept local, condor, uge, slurm (exact, lowercase). */
bool ParseBatchType(std::string_view text, BatchType& out);

struct ProvisionerRequest {
  BatchType batch{BatchType::Local};
  std::string manager_identity;
  int min_workers{1};
  int max_workers{1};
  int cores_per_worker{1};
  std::optional<std::string> env_archive;
  std::string run_dir;
};

struct SessionRequest {
  std::optional<std::string> notebook;
  int port{8888};
  std::string run_dir;
  std::optional<std::string> staged_env_dir;
  std::string manager_identity;
};

class SessionLaunchers {
 public:
  virtual ~SessionLaunchers() = default;
  virtual std::shared_ptr<process::ProcessHandle> LaunchProvisioner(const ProvisionerRequest& request) = 0;
  virtual std::shared_ptr<process::ProcessHandle> LaunchSession(const SessionRequest& request) = 0;
};

struct LauncherConfig {
  std::string factory_program{"vine_factory"};
  std::string jupyter_program{"jupyter"};
  std::string conda_program{"conda"};
  std::string identity_variable{"VINE_MANAGER_NAME"};
};

class CommandLaunchers final : public SessionLaunchers {
 public:
  CommandLaunchers() = default;
  explicit CommandLaunchers(LauncherConfig config) : config_(std::move(config)) {}

  std::shared_ptr<process::ProcessHandle> LaunchProvisioner(const ProvisionerRequest& request) override;
  std::shared_ptr<process::ProcessHandle> LaunchSession(const SessionRequest& request) override;

  /*** ProvisionerOptions: Spawn options for vine_factory (exposed for tests). */
  process::SpawnOptions ProvisionerOptions(const ProvisionerRequest& request) const;
  /*** SessionOptions: Spawn options for jupyter lab, wrapped in conda run when staged. */
  process::SpawnOptions SessionOptions(const SessionRequest& request) const;

 private:
  LauncherConfig config_;
};

}  // namespace launch
}  // namespace floability
