/***
 * Name: floability::archive::ExtractArchive
 * Purpose: Validate-then-write extraction loop over all archive members.
 * Inputs:
 *   - archive_path: archive file
 *   - dest_dir: existing extraction root
 * Outputs: Extracted tree; throws ExtractionError or PathTraversalError
 * Theory of Operation: The root is canonicalized once. For each member the
 *   destination (and link target, if any) is resolved against the current state of
 *   the tree, so links created by earlier members are taken into account before
 *   anything is written. Device nodes and FIFOs are skipped with a warning. Once
 *   all members are in place every symlink is resolved again, since a later link
 *   can change what an earlier one points at.
 */
#include "floability/archive/extractor.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

#include "floability/archive/byte_source.h"
#include "floability/archive/detail/extract.h"
#include "floability/archive/tar_reader.h"
#include "floability/exceptions/extraction_error.h"
#include "floability/exceptions/path_traversal_error.h"
#include "floability/metrics/metrics.h"
#include "floability/support/log.h"

namespace floability::archive {

namespace fs = std::filesystem;

namespace {

void EnsureParent(const detail::MemberDestination& dest, const std::string& name) {
  std::error_code ec;
  fs::create_directories(dest.parent, ec);
  if (ec) {
    throw exceptions::ExtractionError("cannot create parent directory for " + name + ": " + ec.message());
  }
}

void MakeDirectory(const TarMember& member, const detail::MemberDestination& dest) {
  const mode_t mode = detail::SanitizeMode(member.mode, true);
  if (dest.is_root) {
    return;
  }
  EnsureParent(dest, member.name);
  std::error_code ec;
  const auto status = fs::symlink_status(dest.path, ec);
  if (!ec && fs::exists(status) && !fs::is_directory(status)) {
    detail::ClearExistingEntry(dest.path, member.name);
  }
  if (::mkdir(dest.path.c_str(), mode) != 0 && errno != EEXIST) {
    throw exceptions::ExtractionError("cannot create directory " + dest.path.string() + ": " + std::strerror(errno));
  }
  if (::chmod(dest.path.c_str(), mode) != 0) {
    throw exceptions::ExtractionError("chmod failed for " + dest.path.string() + ": " + std::strerror(errno));
  }
}

void MakeSymlink(const fs::path& root, const TarMember& member, const detail::MemberDestination& dest) {
  detail::CheckSymlinkTarget(root, dest, member.name, member.link_target);
  EnsureParent(dest, member.name);
  detail::ClearExistingEntry(dest.path, member.name);
  if (::symlink(member.link_target.c_str(), dest.path.c_str()) != 0) {
    throw exceptions::ExtractionError("cannot create symlink " + dest.path.string() + ": " + std::strerror(errno));
  }
}

void MakeHardlink(const fs::path& root, const TarMember& member, const detail::MemberDestination& dest) {
  // Hardlink targets name another archive member, relative to the root.
  const detail::MemberDestination target = detail::ResolveMemberDestination(root, member.link_target);
  if (target.is_root) {
    throw exceptions::PathTraversalError("hardlink to extraction root rejected: " + member.name);
  }
  EnsureParent(dest, member.name);
  detail::ClearExistingEntry(dest.path, member.name);
  if (::link(target.path.c_str(), dest.path.c_str()) != 0) {
    throw exceptions::ExtractionError("cannot create hardlink " + dest.path.string() + " -> " +
                                      member.link_target + ": " + std::strerror(errno));
  }
}

}  // namespace

auto ExtractArchive(const std::string& archive_path, const std::string& dest_dir) -> void {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Extract);
  std::error_code ec;
  const fs::path root = fs::canonical(dest_dir, ec);
  if (ec || !fs::is_directory(root, ec)) {
    throw exceptions::ExtractionError("extraction root is not a directory: " + dest_dir);
  }

  std::unique_ptr<ByteSource> source = OpenArchiveSource(archive_path);
  TarReader reader(*source);
  TarMember member;
  std::uint64_t skipped = 0;
  try {
    while (reader.Next(member)) {
      const detail::MemberDestination dest = detail::ResolveMemberDestination(root, member.name);
      switch (member.type) {
        case MemberType::Regular:
          if (dest.is_root) {
            throw exceptions::ExtractionError("regular member names the extraction root: " + member.name);
          }
          EnsureParent(dest, member.name);
          detail::ClearExistingEntry(dest.path, member.name);
          detail::WriteRegularMember(reader, member, dest.path);
          break;
        case MemberType::Directory:
          MakeDirectory(member, dest);
          break;
        case MemberType::Symlink:
          MakeSymlink(root, member, dest);
          break;
        case MemberType::Hardlink:
          MakeHardlink(root, member, dest);
          break;
        case MemberType::Other:
          ++skipped;
          support::Log(support::LogLevel::Warning, "extract",
                       "skipping unsupported member type '" + std::string(1, member.typeflag) + "': " + member.name);
          break;
      }
    }
    detail::VerifyLinksWithinRoot(root);
  } catch (const fs::filesystem_error& e) {
    throw exceptions::ExtractionError(std::string("filesystem error during extraction: ") + e.what());
  }

  metrics::Metrics::Count("archive.members", reader.members_read());
  if (skipped > 0) {
    metrics::Metrics::Count("archive.skipped", skipped);
  }
  support::Log(support::LogLevel::Debug, "extract",
               "extracted " + std::to_string(reader.members_read()) + " members from " + archive_path);
}

}  // namespace floability::archive
