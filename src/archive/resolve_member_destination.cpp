/***
 * Name: floability::archive::detail::ResolveMemberDestination
 * Purpose: Map an archive member name to a location that is provably inside root.
 * Inputs:
 *   - root: canonical extraction root
 *   - name: member name as stored in the archive
 * Outputs: MemberDestination with a canonical parent
 * Theory of Operation: Absolute names and leading ".." are rejected lexically. The
 *   joined path and its parent are then canonicalized, which follows any symlinks
 *   already created by earlier members, and both must remain within root.
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

static fs::path CanonicalOrThrow(const fs::path& p, const std::string& name) {
  std::error_code ec;
  fs::path out = fs::weakly_canonical(p, ec);
  if (ec) {
    throw exceptions::ExtractionError("cannot resolve member " + name + ": " + ec.message());
  }
  return out;
}

auto ResolveMemberDestination(const fs::path& root, const std::string& name) -> MemberDestination {
  if (name.empty()) {
    throw exceptions::ExtractionError("archive member with empty name");
  }
  const fs::path raw(name);
  if (raw.is_absolute() || raw.has_root_name() || name.front() == '/') {
    throw exceptions::PathTraversalError("absolute member path rejected: " + name);
  }
  const fs::path rel = raw.lexically_normal();
  if (rel.empty() || rel == ".") {
    return MemberDestination{root, root.parent_path(), true};
  }
  if (*rel.begin() == "..") {
    throw exceptions::PathTraversalError("member escapes extraction root: " + name);
  }

  const fs::path joined = root / rel;
  const fs::path full = CanonicalOrThrow(joined, name);
  if (!support::IsWithinDirectory(root, full)) {
    throw exceptions::PathTraversalError("member escapes extraction root: " + name + " -> " + full.string());
  }
  fs::path leaf = rel.filename();
  fs::path lexical_parent = joined.parent_path();
  if (leaf.empty()) {
    // "dir/" normalizes with a trailing empty component
    leaf = rel.parent_path().filename();
    lexical_parent = lexical_parent.parent_path();
  }
  const fs::path parent = CanonicalOrThrow(lexical_parent, name);
  if (!support::IsWithinDirectory(root, parent)) {
    throw exceptions::PathTraversalError("member parent escapes extraction root: " + name);
  }
  const fs::path dest = parent / leaf;
  if (dest == root) {
    return MemberDestination{root, root.parent_path(), true};
  }
  return MemberDestination{dest, parent, false};
}

}  // namespace floability::archive::detail
