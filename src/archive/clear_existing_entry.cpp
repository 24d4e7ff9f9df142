/***
 * Name: floability::archive::detail::ClearExistingEntry
 * Purpose: Let a later member replace an earlier non-directory entry of the same name.
 * Inputs: Destination path, member name for diagnostics
 * Outputs: none; throws ExtractionError
 * Theory of Operation: Uses lstat semantics, so an existing symlink is removed
 *   rather than followed. Existing directories are kept.
 */
#include "floability/archive/detail/extract.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive::detail {

namespace fs = std::filesystem;

auto ClearExistingEntry(const fs::path& path, const std::string& name) -> void {
  std::error_code ec;
  const auto status = fs::symlink_status(path, ec);
  if (ec || !fs::exists(status) || fs::is_directory(status)) {
    return;
  }
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    throw exceptions::ExtractionError("cannot replace existing entry for " + name + ": " + std::strerror(errno));
  }
}

}  // namespace floability::archive::detail
