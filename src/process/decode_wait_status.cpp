/***
 * Name: floability::process::detail::DecodeWaitStatus
 * Purpose: Convert a waitpid status into a shell-style exit code.
 */
#include "floability/process/detail/exec.h"

#include <sys/wait.h>

namespace floability {
namespace process {
namespace detail {

auto DecodeWaitStatus(int status) -> int {
  constexpr int kSignalBase = 128;
  constexpr int kUnknownExitCode = -1;
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return kSignalBase + WTERMSIG(status);
  }
  return kUnknownExitCode;
}

}  // namespace detail
}  // namespace process
}  // namespace floability
