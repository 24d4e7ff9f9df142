/***
 * Name: floability::rundir (allocator)
 * Purpose: Create the unique working directory that owns everything a session produces.
 * Inputs: Base directory and name prefix
 * Outputs: Absolute path of a freshly created, previously nonexistent directory
 * Theory of Operation: mkdtemp(3) picks a random suffix and creates the directory
 *   with O_EXCL semantics in one step, so concurrent callers can never share a name.
 */
#pragma once

#include <string>

namespace floability {
namespace rundir {

/*** AllocateRunDirectory: Create <base_dir>/<prefix>_<timestamp>_XXXXXX; throws AllocationError. */
std::string AllocateRunDirectory(const std::string& base_dir, const std::string& prefix);

}  // namespace rundir
}  // namespace floability
