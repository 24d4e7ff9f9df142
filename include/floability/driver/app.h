/***
 * Name: floability::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: Parsed options, cleanup registry, collaborators
 * Outputs: Process exit codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; collaborators are passed in so tests can replace them.
 */
#pragma once

#include <string>

#include "floability/cleanup/registry.h"
#include "floability/driver/cli.h"
#include "floability/launch/collaborators.h"
#include "floability/launch/launchers.h"
#include "floability/stages/environment_stager.h"

namespace floability {
namespace driver {

constexpr int kExitOk = 0;
constexpr int kExitAbort = 1;
constexpr int kExitUsage = 2;

constexpr const char* kRunDirPrefix = "floability_run";
constexpr const char* kStagedEnvDirName = "current_conda_env";
constexpr const char* kRunLogName = "floability.log";

/***
 * Name: floability::driver::SessionDeps
 * Purpose: Collaborators used by RunSession.
 */
struct SessionDeps {
  launch::SessionLaunchers& launchers;
  launch::EnvironmentMaterializer& materializer;
  launch::DataFetcher& fetcher;
  stages::StagerConfig stager;
};

/***
 * Name: floability::driver::RunSession
 * Purpose: The "run" entry point: allocate, fetch, stage, launch, supervise, clean up.
 * Inputs: opts, the process-wide registry (already wired to the signal bridge), deps
 * Outputs: kExitOk after a supervised shutdown; kExitAbort when any phase fails
 * Theory of Operation: Resources are registered as soon as they exist. Any failure
 *   before supervision logs the phase and reason, runs Cleanup(), and returns
 *   without starting the remaining children.
 */
int RunSession(const RunOptions& opts, cleanup::CleanupRegistry& registry, const SessionDeps& deps);

/***
 * Name: floability::driver::RunFetch
 * Purpose: The "fetch" entry point.
 * Inputs: opts (data_spec required), fetcher
 * Outputs: kExitOk or kExitAbort
 */
int RunFetch(const RunOptions& opts, launch::DataFetcher& fetcher);

/***
 * Name: floability::driver::IsArchivePath
 * Purpose: Decide whether an --environment value is an archive or a description.
 * Inputs: path
 * Outputs: true for .tar, .tar.gz, .tgz, .tar.bz2, .tbz2, .tar.xz, .txz
 */
bool IsArchivePath(const std::string& path);

/***
 * Name: floability::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format to stdout if enabled.
 * Inputs: opts
 * Outputs: None
 * Theory of Operation: Reads the global Metrics registry and prints either JSON or text.
 */
void ReportMetricsIfRequested(const RunOptions& opts);

}  // namespace driver
}  // namespace floability
