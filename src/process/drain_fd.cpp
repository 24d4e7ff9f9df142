/***
 * Name: floability::process::detail::DrainFd
 * Purpose: Collect a child's combined output from the read end of its pipe.
 * Inputs: fd - read end; every write end held by this process must be closed
 * Outputs: out - bytes appended in arrival order
 * Theory of Operation: Blocking reads until EOF, retried on EINTR. EOF arrives
 *   once every process holding a write end has exited or closed it.
 */
#include "floability/process/detail/exec.h"

#include <cerrno>
#include <cstddef>
#include <string>

#include <unistd.h>

namespace floability {
namespace process {
namespace detail {

void DrainFd(int fd, std::string& out) {
  constexpr std::size_t kBufferSize = 4096;
  char buffer[kBufferSize];
  for (;;) {
    const ssize_t bytes_read = ::read(fd, buffer, kBufferSize);
    if (bytes_read > 0) {
      out.append(buffer, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
}

}  // namespace detail
}  // namespace process
}  // namespace floability
