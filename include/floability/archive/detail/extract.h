/***
 * Name: floability::archive::detail (extract)
 * Purpose: Per-member validation and write helpers used by ExtractArchive.
 * Inputs: Canonical extraction root, member metadata
 * Outputs: Validated destinations; files, directories, and links on disk
 * Theory of Operation: Validation functions throw PathTraversalError and never touch
 *   the filesystem beyond reading it. Write functions assume validation already ran.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <sys/types.h>

#include "floability/archive/tar_reader.h"

namespace floability {
namespace archive {
namespace detail {

struct MemberDestination {
  std::filesystem::path path;    // canonical parent joined with the final name component
  std::filesystem::path parent;  // canonical parent directory, inside the root
  bool is_root{false};           // member names the root itself ("./")
};

/*** ResolveMemberDestination: Validate name against root; throws PathTraversalError. */
MemberDestination ResolveMemberDestination(const std::filesystem::path& root, const std::string& name);

/*** CheckSymlinkTarget: Resolve target relative to parent and require it stay inside root. */
void CheckSymlinkTarget(const std::filesystem::path& root, const MemberDestination& dest, const std::string& name,
                        const std::string& target);

/*** VerifyLinksWithinRoot: After extraction, require every symlink in the tree to resolve inside root. */
void VerifyLinksWithinRoot(const std::filesystem::path& root);

/*** SanitizeMode: Permission bits only, with owner access forced on. */
mode_t SanitizeMode(std::uint32_t mode, bool is_directory);

/*** WriteRegularMember: Create dest exclusively and stream the payload into it. */
void WriteRegularMember(TarReader& reader, const TarMember& member, const std::filesystem::path& dest);

/*** ClearExistingEntry: Unlink a non-directory at path so the member can replace it. */
void ClearExistingEntry(const std::filesystem::path& path, const std::string& name);

}  // namespace detail
}  // namespace archive
}  // namespace floability
