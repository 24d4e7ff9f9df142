/***
 * Name: floability::archive::detail::WriteRegularMember
 * Purpose: Materialize a regular file member.
 * Inputs:
 *   - reader: positioned on the member
 *   - member: header (mode, size)
 *   - dest: validated destination path
 * Outputs: File on disk; throws ExtractionError
 * Theory of Operation: O_EXCL|O_NOFOLLOW guarantees the bytes land in a fresh inode
 *   at dest and are never redirected through a link swapped in after validation.
 */
#include "floability/archive/detail/extract.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "floability/exceptions/extraction_error.h"
#include "floability/support/scoped_fd.h"

namespace floability::archive::detail {

auto WriteRegularMember(TarReader& reader, const TarMember& member, const std::filesystem::path& dest) -> void {
  const mode_t mode = SanitizeMode(member.mode, false);
  const int fd = ::open(dest.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode);
  if (fd < 0) {
    throw exceptions::ExtractionError("cannot create " + dest.string() + ": " + std::strerror(errno));
  }
  support::ScopedFd guard(fd);
  reader.ReadPayload([&](const std::uint8_t* data, std::size_t len) {
    std::size_t done = 0;
    while (done < len) {
      const ssize_t n = ::write(fd, data + done, len - done);
      if (n < 0) {
        if (errno == EINTR) continue;
        throw exceptions::ExtractionError("write failed for " + dest.string() + ": " + std::strerror(errno));
      }
      done += static_cast<std::size_t>(n);
    }
  });
  // umask may have narrowed the creation mode
  if (::fchmod(fd, mode) != 0) {
    throw exceptions::ExtractionError("chmod failed for " + dest.string() + ": " + std::strerror(errno));
  }
  if (::close(guard.Release()) != 0) {
    throw exceptions::ExtractionError("close failed for " + dest.string() + ": " + std::strerror(errno));
  }
}

}  // namespace floability::archive::detail
