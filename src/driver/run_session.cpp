/***
 * Name: floability::driver::RunSession
 * Purpose: Execute one supervised session end to end.
 * Inputs: opts, registry, deps
 * Outputs: Exit code (kExitOk / kExitAbort)
 * Theory of Operation:
 *   allocate run dir -> mirror log -> fetch data -> resolve identity ->
 *   [materialize] -> register + create staged dir -> stage -> launch provisioner ->
 *   launch session -> supervise. `phase` names the step in progress so every
 *   abort reports where it failed. Staging errors abort before any child starts.
 */
#include "floability/driver/app.h"

#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include "floability/exceptions/fixup_error.h"
#include "floability/exceptions/floability_exception.h"
#include "floability/exceptions/path_traversal_error.h"
#include "floability/exceptions/staging_write_error.h"
#include "floability/rundir/allocator.h"
#include "floability/supervise/loop.h"
#include "floability/support/identity.h"
#include "floability/support/log.h"

namespace floability::driver {

namespace fs = std::filesystem;

static void Info(const std::string& message) { support::Log(support::LogLevel::Info, "floability", message); }

static int Abort(cleanup::CleanupRegistry& registry, const std::string& phase, const std::string& why) {
  support::Log(support::LogLevel::Error, "floability", phase + " failed: " + why);
  const cleanup::CleanupReport report = registry.Cleanup();
  if (!report.performed) {
    registry.AwaitCompletion();
  }
  return kExitAbort;
}

static std::string PrepareStagingDir(cleanup::CleanupRegistry& registry, const std::string& run_dir) {
  const std::string staged = (fs::path(run_dir) / kStagedEnvDirName).string();
  registry.RegisterDirectory(staged);
  std::error_code ec;
  fs::create_directories(staged, ec);
  if (ec) {
    throw exceptions::StagingWriteError("cannot create " + staged + ": " + ec.message());
  }
  return staged;
}

auto RunSession(const RunOptions& opts, cleanup::CleanupRegistry& registry, const SessionDeps& deps) -> int {
  std::string phase = "allocate run directory";
  std::string run_dir;
  try {
    run_dir = rundir::AllocateRunDirectory(opts.base_dir, kRunDirPrefix);
  } catch (const exceptions::FloabilityException& e) {
    return Abort(registry, phase, e.what());
  }
  std::string log_err;
  if (!support::MirrorLogToFile((fs::path(run_dir) / kRunLogName).string(), log_err)) {
    support::Log(support::LogLevel::Warning, "floability", log_err);
  }
  Info("run directory: " + run_dir + ". All logs will be stored here.");

  std::shared_ptr<process::ProcessHandle> provisioner;
  std::shared_ptr<process::ProcessHandle> session;
  try {
    if (opts.data_spec) {
      phase = "fetch data";
      Info("fetching data from " + *opts.data_spec);
      deps.fetcher.Fetch(*opts.data_spec, opts.backpack_root);
    }

    const std::string identity = opts.manager_name.value_or(support::GenerateManagerIdentity());
    Info("manager name: " + identity);

    std::optional<std::string> archive;
    std::optional<std::string> staged_dir;
    if (opts.environment) {
      if (IsArchivePath(*opts.environment)) {
        archive = fs::absolute(*opts.environment).string();
        Info("using packed environment " + *archive);
      } else {
        phase = "build environment";
        Info("creating packed environment from " + *opts.environment);
        archive = deps.materializer.Materialize(*opts.environment, identity, run_dir);
      }
      phase = "stage environment";
      staged_dir = PrepareStagingDir(registry, run_dir);
      stages::EnvironmentStager stager(deps.stager, registry);
      stager.Stage(*archive, *staged_dir, identity);
    } else {
      Info("no environment given; skipping staging");
    }

    phase = "start provisioner";
    if (registry.CleanupStarted()) {
      return Abort(registry, phase, "interrupted");
    }
    launch::ProvisionerRequest prov_req;
    prov_req.batch = opts.batch_type;
    prov_req.manager_identity = identity;
    prov_req.min_workers = 1;
    prov_req.max_workers = opts.workers;
    prov_req.cores_per_worker = opts.cores_per_worker;
    prov_req.env_archive = archive;
    prov_req.run_dir = run_dir;
    provisioner = deps.launchers.LaunchProvisioner(prov_req);
    registry.RegisterProcess(provisioner);

    phase = "start interactive session";
    if (registry.CleanupStarted()) {
      return Abort(registry, phase, "interrupted");
    }
    launch::SessionRequest sess_req;
    sess_req.notebook = opts.notebook;
    sess_req.port = opts.jupyter_port;
    sess_req.run_dir = run_dir;
    sess_req.staged_env_dir = staged_dir;
    sess_req.manager_identity = identity;
    session = deps.launchers.LaunchSession(sess_req);
    registry.RegisterProcess(session);
  } catch (const exceptions::PathTraversalError& e) {
    return Abort(registry, phase, std::string("refusing unsafe archive: ") + e.what());
  } catch (const exceptions::FixupError& e) {
    return Abort(registry, phase, std::string(e.what()) + (e.output().empty() ? "" : "\n" + e.output()));
  } catch (const exceptions::FloabilityException& e) {
    return Abort(registry, phase, e.what());
  } catch (const std::exception& e) {
    return Abort(registry, phase, std::string("unexpected error: ") + e.what());
  }

  supervise::SupervisionLoop loop(registry, provisioner, session, opts.poll_interval);
  const supervise::SupervisionResult result = loop.Run();
  if (result.outcome == supervise::SupervisionOutcome::Interrupted) {
    registry.AwaitCompletion();
    Info("session interrupted");
    return kExitAbort;
  }
  Info("exiting");
  return kExitOk;
}

}  // namespace floability::driver
