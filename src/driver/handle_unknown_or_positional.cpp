/***
 * Name: floability::driver::detail::HandleUnknownOrPositional
 * Purpose: Reject any token no earlier handler accepted.
 * Inputs:
 *   - arg: current argument string
 *   - err: error stream
 * Outputs: OptResult::Error
 * Theory of Operation: This is the last handler evaluated by ParseCli. The
 *   sub-command is the only positional, and it is consumed before the handlers run.
 */
#include "floability/driver/cli_parse.h"

#include <ostream>
#include <string>

namespace floability {
namespace driver {
namespace detail {

auto HandleUnknownOrPositional(const std::string& arg, std::ostream& err) -> OptResult {
  if (!arg.empty() && arg[0] == '-') {
    err << "floability: error: unknown option '" << arg << "'" << '\n';
  } else {
    err << "floability: error: unexpected argument '" << arg << "'" << '\n';
  }
  return OptResult::Error;
}

}  // namespace detail
}  // namespace driver
}  // namespace floability
