/***
 * Name: floability::process::detail::DescribeCommand
 * Purpose: Render argv as a single display string for log and error messages.
 */
#include "floability/process/detail/exec.h"

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace floability {
namespace process {
namespace detail {

auto DescribeCommand(const std::vector<std::string>& argv) -> std::string {
  std::ostringstream assembled;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i != 0U) {
      assembled << ' ';
    }
    assembled << argv[i];
  }
  return assembled.str();
}

}  // namespace detail
}  // namespace process
}  // namespace floability
