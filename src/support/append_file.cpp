/***
 * Name: floability::support::AppendFile
 * Purpose: Append a string to the end of a file without disturbing prior content.
 * Inputs:
 *   - path: file to append to (created if missing; parents must exist)
 *   - data: content to append
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: open(2) with O_APPEND | O_NOFOLLOW, so a symlink planted at
 *   path is refused instead of redirecting the write. Short writes are retried.
 */
#include "floability/support/fs.h"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "floability/support/scoped_fd.h"

namespace floability {
namespace support {

bool AppendFile(const std::string& path, const std::string& data, std::string& err) {
  constexpr mode_t kFileMode = 0644;
  ScopedFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_NOFOLLOW | O_CLOEXEC, kFileMode));
  if (!fd.Valid()) {
    err = "failed to open file for append: " + path + ": " + std::strerror(errno);
    return false;
  }
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd.Get(), data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      err = "failed to append to file: " + path + ": " + std::strerror(errno);
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  if (::close(fd.Release()) != 0) {
    err = "failed to close file: " + path + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace floability
