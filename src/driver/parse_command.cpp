/***
 * Name: floability::driver::detail::ParseCommand
 * Purpose: Recognize the sub-command word.
 */
#include "floability/driver/cli_parse.h"

#include <string>

namespace floability {
namespace driver {
namespace detail {

auto ParseCommand(const std::string& word, RunOptions::Command& out) -> bool {
  if (word == "run") {
    out = RunOptions::Command::Run;
    return true;
  }
  if (word == "fetch") {
    out = RunOptions::Command::Fetch;
    return true;
  }
  return false;
}

}  // namespace detail
}  // namespace driver
}  // namespace floability
