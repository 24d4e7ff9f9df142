/***
 * Name: floability::support (fs)
 * Purpose: Minimal file and directory helpers shared by staging, extraction, and cleanup.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk; status booleans with error text
 * Theory of Operation: Thin wrappers over POSIX calls and std::filesystem that
 *   centralize error reporting; none of them throw.
 */
#pragma once

#include <filesystem>
#include <string>

namespace floability {
namespace support {

/*** AppendFile: Append data to path, creating the file (not its parents); refuses a symlink at path. */
bool AppendFile(const std::string& path, const std::string& data, std::string& err);

/*** RemoveTree: Recursively remove path, restoring owner write permission as needed. */
bool RemoveTree(const std::string& path, std::string& err);

/*** IsWithinDirectory: True if candidate equals root or lies beneath it (both already canonical). */
bool IsWithinDirectory(const std::filesystem::path& root, const std::filesystem::path& candidate);

}  // namespace support
}  // namespace floability
