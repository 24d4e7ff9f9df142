/***
 * Name: floability::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch; last handler rejects leftovers.
 */
#include "floability/driver/cli_parse.h"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace floability {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args, int& index, int argc, RunOptions& dst, std::ostream& err)
    -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleHelpArg(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleMetricsArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) { return HandleSwitch(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleValueArg(args, idx, argc, dst, err); }},
      HandlerFn{[&](int& idx) { return HandleUnknownOrPositional(args[static_cast<std::size_t>(idx)], err); }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result == OptResult::Error) {
      return OptResult::Error;
    }
    if (result == OptResult::Handled) {
      return OptResult::Handled;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace floability
