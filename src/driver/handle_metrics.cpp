/***
 * Name: floability::driver::detail::HandleMetricsArg
 * Purpose: Handle --metrics and --metrics=json|text option.
 * Inputs:
 *   - arg: current argument string
 *   - dst: options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Recognizes exact "--metrics" and prefix "--metrics=", validates value.
 */
#include "floability/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <string_view>

namespace floability {
namespace driver {
namespace detail {

auto HandleMetricsArg(const std::string& arg, RunOptions& dst, std::ostream& err) -> OptResult {
  if (arg == "--metrics") {
    dst.metrics = true;
    dst.metrics_format = RunOptions::MetricsFormat::Text;
    return OptResult::Handled;
  }
  constexpr std::string_view kPrefix{"--metrics="};
  if (arg.starts_with(kPrefix)) {
    dst.metrics = true;
    const std::string value = arg.substr(kPrefix.size());
    if (value == "json") {
      dst.metrics_format = RunOptions::MetricsFormat::Json;
    } else if (value == "text") {
      dst.metrics_format = RunOptions::MetricsFormat::Text;
    } else {
      err << "floability: error: unknown metrics format '" << value << "' (expected json or text)" << '\n';
      return OptResult::Error;
    }
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace floability
