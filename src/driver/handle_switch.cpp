/***
 * Name: floability::driver::detail::HandleSwitch
 * Purpose: Handle simple boolean switches: -v and --verbose.
 * Inputs:
 *   - arg: current argument string
 *   - dst: options destination
 * Outputs: OptResult indicating match
 */
#include "floability/driver/cli_parse.h"

#include <string>

namespace floability {
namespace driver {
namespace detail {

auto HandleSwitch(const std::string& arg, RunOptions& dst) -> OptResult {
  if (arg == "-v" || arg == "--verbose") {
    dst.verbose = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace floability
