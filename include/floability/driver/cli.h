/***
 * Name: floability::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: "floability run|fetch [options]". Options accept both
 *   "--name value" and "--name=value". Definitions live in .cpp files.
 */
#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>

#include "floability/launch/launchers.h"

namespace floability {
namespace driver {

/***
 * Name: floability::driver::RunOptions
 * Purpose: Hold parsed command-line options for a floability invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by RunSession / RunFetch.
 * Theory of Operation: Defaults match an interactive single-machine session.
 */
struct RunOptions {
  enum class Command { None, Run, Fetch };
  Command command = Command::None;

  std::optional<std::string> environment;               // --environment <archive|description>
  std::optional<std::string> notebook;                  // --notebook <file.ipynb>
  launch::BatchType batch_type = launch::BatchType::Local;  // --batch-type
  int workers = 5;                                      // --workers
  int cores_per_worker = 1;                             // --cores-per-worker
  std::optional<std::string> manager_name;              // --manager-name
  int jupyter_port = 8888;                              // --jupyter-port
  std::string base_dir = "/tmp";                        // --base-dir
  std::optional<std::string> data_spec;                 // --data-spec
  std::string backpack_root = ".";                      // --backpack-root
  std::chrono::milliseconds poll_interval{5000};        // --poll-interval <seconds>
  std::chrono::milliseconds grace_period{5000};         // --grace-period <seconds>

  bool verbose = false;    // -v, --verbose
  bool show_help = false;  // -h, --help
  bool metrics = false;    // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text;  // --metrics[=json|text]
};

namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

/***
 * Name: floability::driver::ParseCli
 * Purpose: Parse command-line arguments into a RunOptions structure.
 * Inputs:
 *   - argc, argv: process arguments
 *   - dst: options to populate (reset to defaults first)
 *   - err: stream for diagnostics
 * Outputs:
 *   - bool: true on success; false on any parse or validation error
 * Theory of Operation: The first token selects the sub-command; remaining tokens
 *   are dispatched through RunHandlers, then ValidateOptions checks ranges.
 */
bool ParseCli(int argc, const char* const* argv, RunOptions& dst, std::ostream& err);

/*** ValidateOptions: Range and consistency checks after parsing. */
bool ValidateOptions(const RunOptions& opts, std::ostream& err);

/*** PrintUsage: Render usage text for floability. */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace floability
