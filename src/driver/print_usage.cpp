/***
 * Name: floability::driver::PrintUsage
 * Purpose: Print CLI usage information for floability.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "floability/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace floability::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"floability"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " run [options]" << '\n'
      << "       " << program_name << " fetch --data-spec <file> [--backpack-root <dir>]" << '\n'
      << '\n'
      << "Run options:" << '\n'
      << "  --environment <path>      Packed environment (.tar.gz, .tar.bz2, .tar.xz, .tar)" << '\n'
      << "                            or an environment description to build one from" << '\n'
      << "  --notebook <file>         Notebook to open in JupyterLab" << '\n'
      << "  --batch-type <type>       local, condor, uge or slurm (default: local)" << '\n'
      << "  --workers <n>             Maximum number of workers (default: 5)" << '\n'
      << "  --cores-per-worker <n>    Cores per worker (default: 1)" << '\n'
      << "  --manager-name <name>     Manager name (default: floability-<uuid>)" << '\n'
      << "  --jupyter-port <port>     JupyterLab port (default: 8888)" << '\n'
      << "  --base-dir <dir>          Where run directories are created (default: /tmp)" << '\n'
      << "  --data-spec <file>        Fetch the data it describes before starting" << '\n'
      << "  --backpack-root <dir>     Root for fetched data (default: .)" << '\n'
      << "  --poll-interval <time>    Time between liveness checks, at least 100ms (default: 5)" << '\n'
      << "  --grace-period <time>     Time between SIGTERM and SIGKILL (default: 5)" << '\n'
      << '\n'
      << "Common options:" << '\n'
      << "  -h, --help                Print this help and exit" << '\n'
      << "  -v, --verbose             Debug logging (also FLOABILITY_VERBOSE=1)" << '\n'
      << "  --metrics[=json|text]     Print phase timings on exit (default: text)" << '\n'
      << '\n'
      << "Options accept both '--name value' and '--name=value'." << '\n'
      << "Times are seconds, or take an 's' or 'ms' suffix (e.g. 2s, 500ms)." << '\n';
}

}  // namespace floability::driver
