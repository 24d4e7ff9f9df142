/***
 * Name: floability::archive::detail::CheckSymlinkTarget
 * Purpose: Refuse symlink members that would point outside the extraction root.
 * Inputs:
 *   - root: canonical extraction root
 *   - dest: validated destination of the link itself
 *   - name, target: member name and stored link target
 * Outputs: none; throws PathTraversalError or ExtractionError
 * Theory of Operation: A relative target is resolved from the link's parent, an
 *   absolute one as-is. Rejecting the link at creation time means a later member
 *   can never be written through it.
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

auto CheckSymlinkTarget(const fs::path& root, const MemberDestination& dest, const std::string& name,
                        const std::string& target) -> void {
  if (target.empty()) {
    throw exceptions::ExtractionError("symlink member has empty target: " + name);
  }
  const fs::path t(target);
  const fs::path joined = t.is_absolute() ? t : dest.parent / t;
  std::error_code ec;
  const fs::path resolved = fs::weakly_canonical(joined, ec);
  if (ec) {
    throw exceptions::ExtractionError("cannot resolve symlink target of " + name + ": " + ec.message());
  }
  if (!support::IsWithinDirectory(root, resolved)) {
    throw exceptions::PathTraversalError("symlink escapes extraction root: " + name + " -> " + target);
  }
}

}  // namespace floability::archive::detail
