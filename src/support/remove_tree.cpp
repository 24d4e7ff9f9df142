/***
 * Name: floability::support::RemoveTree
 * Purpose: Recursively delete a directory tree such as a staged environment.
 * Inputs:
 *   - path: root of the tree (a missing path is treated as already removed)
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: Archives may carry read-only directories, which would make
 *   remove_all fail half way; owner rwx is restored on every directory first.
 *   Symlinks are never followed.
 */
#include "floability/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace floability {
namespace support {

namespace fs = std::filesystem;

static void RestoreOwnerAccess(const fs::path& root) {
  std::error_code ec;
  fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    if (it->is_directory(ec) && !it->is_symlink(ec)) {
      fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
    }
    it.increment(ec);
  }
}

bool RemoveTree(const std::string& path, std::string& err) {
  std::error_code ec;
  const auto status = fs::symlink_status(path, ec);
  if (ec || !fs::exists(status)) {
    return true;
  }
  if (fs::is_directory(status)) {
    RestoreOwnerAccess(path);
  }
  fs::remove_all(path, ec);
  if (ec) {
    err = "failed to remove " + path + ": " + ec.message();
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace floability
