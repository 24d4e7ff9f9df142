/***
 * Name: floability::archive::detail::VerifyLinksWithinRoot
 * Purpose: Prove that no symlink in the finished tree resolves outside the root.
 * Inputs: root - canonical extraction root, fully extracted
 * Outputs: none; throws PathTraversalError or ExtractionError
 * Theory of Operation: Each link was checked against the tree as it stood when the
 *   link was created, but a later link can redirect a component of an earlier
 *   target (a -> "b/x/..", then b/x -> ".."). Walking the final tree without
 *   following links and resolving every link in place catches those chains before
 *   anyone writes through them.
 */
#include "floability/archive/detail/extract.h"

#include <filesystem>
#include <string>
#include <system_error>

#include "floability/exceptions/extraction_error.h"
#include "floability/exceptions/path_traversal_error.h"
#include "floability/support/fs.h"

namespace floability::archive::detail {

namespace fs = std::filesystem;

auto VerifyLinksWithinRoot(const fs::path& root) -> void {
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
  if (ec) {
    throw exceptions::ExtractionError("cannot scan extracted tree " + root.string() + ": " + ec.message());
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw exceptions::ExtractionError("cannot scan extracted tree " + root.string() + ": " + ec.message());
    }
    if (!it->is_symlink(ec)) {
      continue;
    }
    const fs::path resolved = fs::weakly_canonical(it->path(), ec);
    if (ec) {
      throw exceptions::ExtractionError("cannot resolve symlink " + it->path().string() + ": " + ec.message());
    }
    if (!support::IsWithinDirectory(root, resolved)) {
      throw exceptions::PathTraversalError("symlink resolves outside extraction root: " +
                                           it->path().lexically_relative(root).string() + " -> " + resolved.string());
    }
  }
  if (ec) {
    throw exceptions::ExtractionError("cannot scan extracted tree " + root.string() + ": " + ec.message());
  }
}

}  // namespace floability::archive::detail
