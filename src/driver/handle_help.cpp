/***
 * Name: floability::driver::detail::HandleHelpArg
 * Purpose: Handle -h and --help.
 * Inputs:
 *   - arg: current argument string
 *   - dst: options destination
 * Outputs: OptResult::Handled when matched
 */
#include "floability/driver/cli_parse.h"

#include <string>

namespace floability {
namespace driver {
namespace detail {

auto HandleHelpArg(const std::string& arg, RunOptions& dst) -> OptResult {
  if (arg == "-h" || arg == "--help") {
    dst.show_help = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace floability
