/***
 * Name: floability::driver::detail::HandleValueArg
 * Purpose: Handle every option that takes a value.
 * Inputs:
 *   - args: full argument vector
 *   - index: current index (advanced past a separate value)
 *   - argc: total argument count
 *   - dst: options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Looks the option name up in ValueOptions(); the value is
 *   either after '=' in the same token or the next token.
 */
#include "floability/driver/cli_parse.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace floability {
namespace driver {
namespace detail {

auto HandleValueArg(const std::vector<std::string>& args, int& index, int argc, RunOptions& dst,
                    std::ostream& err) -> OptResult {
  const std::string& arg = args[static_cast<std::size_t>(index)];
  if (!arg.starts_with("--")) {
    return OptResult::NotMatched;
  }
  const auto eq = arg.find('=');
  const std::string name = arg.substr(0, eq);
  for (const auto& option : ValueOptions()) {
    if (name != option.name) {
      continue;
    }
    std::string value;
    if (eq != std::string::npos) {
      value = arg.substr(eq + 1);
    } else {
      if (index + 1 >= argc) {
        err << "floability: error: missing value after '" << name << "'" << '\n';
        return OptResult::Error;
      }
      ++index;
      value = args[static_cast<std::size_t>(index)];
    }
    return option.apply(value, dst, err) ? OptResult::Handled : OptResult::Error;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace floability
