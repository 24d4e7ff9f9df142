/***
 * Name: floability::driver::ParseCli
 * Purpose: Parse command-line arguments into a RunOptions structure.
 * Inputs:
 *   - argc, argv: process arguments
 *   - dst: options destination (reset to defaults)
 *   - err: stream for diagnostics
 * Outputs:
 *   - bool: true on successful parse, false on error
 * Theory of Operation: "-h" anywhere wins. Otherwise argv[1] must be a
 *   sub-command, and the rest goes through RunHandlers and ValidateOptions.
 */
#include "floability/driver/cli.h"
#include "floability/driver/cli_parse.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace floability::driver {

auto ParseCli(int argc, const char* const* argv, RunOptions& dst, std::ostream& err) -> bool {
  dst = RunOptions{};
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    const char* arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    args.emplace_back(arg == nullptr ? "" : arg);
  }

  int index = 1;
  if (index < argc && detail::HandleHelpArg(args[static_cast<std::size_t>(index)], dst) ==
                          detail::OptResult::Handled) {
    return true;
  }
  if (index >= argc) {
    err << "floability: error: no sub-command given (expected run or fetch)" << '\n';
    return false;
  }
  if (!detail::ParseCommand(args[static_cast<std::size_t>(index)], dst.command)) {
    err << "floability: error: unknown sub-command '" << args[static_cast<std::size_t>(index)]
        << "' (expected run or fetch)" << '\n';
    return false;
  }

  for (++index; index < argc; ++index) {
    if (detail::RunHandlers(args, index, argc, dst, err) == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help) {
      return true;
    }
  }
  return ValidateOptions(dst, err);
}

}  // namespace floability::driver
