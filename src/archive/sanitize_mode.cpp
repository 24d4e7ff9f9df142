/***
 * Name: floability::archive::detail::SanitizeMode
 * Purpose: Strip setuid/setgid/sticky bits and keep extracted entries owner-accessible.
 * Inputs: Stored tar mode, whether the member is a directory
 * Outputs: mode_t suitable for open/mkdir/chmod
 */
#include "floability/archive/detail/extract.h"

#include <cstdint>
#include <sys/stat.h>

namespace floability::archive::detail {

auto SanitizeMode(std::uint32_t mode, bool is_directory) -> mode_t {
  const auto perms = static_cast<mode_t>(mode & 0777U);
  return is_directory ? (perms | S_IRWXU) : (perms | S_IRUSR | S_IWUSR);
}

}  // namespace floability::archive::detail
