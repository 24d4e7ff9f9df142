/***
 * Name: floability::archive::ExtractArchive
 * Purpose: Unpack a (possibly compressed) tar archive without ever writing outside dest_dir.
 * Inputs:
 *   - archive_path: tar, tar.gz, tar.bz2, or tar.xz; encoding detected from content
 *   - dest_dir: existing directory that becomes the extraction root
 * Outputs: Extracted tree under dest_dir
 * Theory of Operation: Each member is validated before any of its bytes are written:
 *   the member path, its parent, and any link target must canonicalize to dest_dir or
 *   a descendant. The first violation raises PathTraversalError and stops extraction.
 *   Read and write failures raise ExtractionError; whatever was already written stays
 *   in place for the caller's cleanup.
 */
#pragma once

#include <string>

namespace floability {
namespace archive {

void ExtractArchive(const std::string& archive_path, const std::string& dest_dir);

}  // namespace archive
}  // namespace floability
