/***
 * Name: floability::support::IsWithinDirectory
 * Purpose: Decide whether a canonical path is the root itself or one of its descendants.
 * Inputs:
 *   - root: canonical directory path
 *   - candidate: canonical path to test
 * Outputs: true when every component of root prefixes candidate
 * Theory of Operation: Compares path components rather than strings, so "/a/bc"
 *   is not mistaken for a child of "/a/b".
 */
#include "floability/support/fs.h"

#include <algorithm>
#include <filesystem>
#include <iterator>

namespace floability {
namespace support {

bool IsWithinDirectory(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  auto root_it = root.begin();
  auto cand_it = candidate.begin();
  for (; root_it != root.end(); ++root_it, ++cand_it) {
    if (root_it->empty() && std::next(root_it) == root.end()) {
      break;  // trailing separator on root
    }
    if (cand_it == candidate.end() || *root_it != *cand_it) {
      return false;
    }
  }
  return std::none_of(cand_it, candidate.end(), [](const std::filesystem::path& part) { return part == ".."; });
}

}  // namespace support
}  // namespace floability
