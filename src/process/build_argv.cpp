/***
 * Name: floability::process::detail::BuildArgvMutable
 * Purpose: Construct a null-terminated argv array from a vector<string>.
 * Inputs: args (vector<string>)
 * Outputs: vector<char*> suitable for execvpe
 * Theory of Operation: Pointers reference the string storage; ensure lifetime.
 */
#include "floability/process/detail/exec.h"

#include <string>
#include <vector>

namespace floability {
namespace process {
namespace detail {

auto BuildArgvMutable(std::vector<std::string>& args) -> std::vector<char*> {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1U);
  for (auto& arg_str : args) {
    argv.push_back(arg_str.data());
  }
  argv.push_back(nullptr);
  return argv;
}

}  // namespace detail
}  // namespace process
}  // namespace floability
