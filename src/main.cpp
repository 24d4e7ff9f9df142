/***
 * Name: floability::main
 * Purpose: Entry point for the floability session orchestrator CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: 0 after a supervised shutdown, 1 on abort, 2 on usage errors;
 *     128+N when terminated by signal N.
 * Theory of Operation: The signal bridge is installed before any resource is
 *   acquired (and before any other thread starts) so an interrupt at any point
 *   still releases whatever has been registered.
 */
#include <exception>
#include <iostream>

#include "floability/cleanup/registry.h"
#include "floability/cleanup/signal_bridge.h"
#include "floability/driver/app.h"
#include "floability/driver/cli.h"
#include "floability/exceptions/floability_exception.h"
#include "floability/launch/collaborators.h"
#include "floability/launch/launchers.h"
#include "floability/metrics/metrics.h"
#include "floability/support/log.h"

using floability::driver::RunOptions;

int main(int argc, char** argv) {
  try {
    RunOptions opts;
    if (!floability::driver::ParseCli(argc, argv, opts, std::cerr)) {
      floability::driver::PrintUsage(std::cerr, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return floability::driver::kExitUsage;
    }
    if (opts.show_help) {
      floability::driver::PrintUsage(std::cout, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return floability::driver::kExitOk;
    }
    floability::support::SetLogLevel(opts.verbose || floability::support::UseEnvVerbose()
                                          ? floability::support::LogLevel::Debug
                                          : floability::support::LogLevel::Info);
    floability::metrics::Metrics::Enable(opts.metrics);

    floability::cleanup::CleanupRegistry registry(opts.grace_period);
    floability::cleanup::SignalBridge bridge(registry);
    bridge.Install();

    floability::launch::CommandDataFetcher fetcher;
    int ret_code = floability::driver::kExitOk;
    if (opts.command == RunOptions::Command::Fetch) {
      ret_code = floability::driver::RunFetch(opts, fetcher);
    } else {
      floability::launch::CommandLaunchers launchers;
      floability::launch::CommandMaterializer materializer;
      const floability::driver::SessionDeps deps{launchers, materializer, fetcher, {}};
      ret_code = floability::driver::RunSession(opts, registry, deps);
    }
    floability::driver::ReportMetricsIfRequested(opts);
    return ret_code;
  } catch (const floability::exceptions::FloabilityException& ex) {
    std::cerr << "floability: " << ex.what() << '\n';
    return floability::driver::kExitAbort;
  } catch (const std::exception& ex) {
    std::cerr << "floability: internal error: " << ex.what() << '\n';
    return floability::driver::kExitAbort;
  }
}
