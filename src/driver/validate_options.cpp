/***
 * Name: floability::driver::ValidateOptions
 * Purpose: Reject option values that cannot describe a valid session.
 * Inputs: opts, err
 * Outputs: true when the options are usable
 * Theory of Operation: Numeric ranges are enforced while parsing; this checks
 *   what depends on the sub-command.
 */
#include "floability/driver/cli.h"

#include <ostream>

namespace floability::driver {

auto ValidateOptions(const RunOptions& opts, std::ostream& err) -> bool {
  if (opts.command == RunOptions::Command::Fetch && !opts.data_spec) {
    err << "floability: error: fetch requires --data-spec <file>" << '\n';
    return false;
  }
  return true;
}

}  // namespace floability::driver
