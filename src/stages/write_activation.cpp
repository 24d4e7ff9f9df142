/***
 * Name: floability::stages::EnvironmentStager::WriteActivation
 * Purpose: Export the manager identity whenever the staged environment is activated.
 * Inputs: dest_dir, manager_identity
 * Outputs: Line appended to the activation script; throws StagingWriteError or
 *   PathTraversalError
 * Theory of Operation: Append-only, so hooks shipped inside the archive survive.
 *   A leading newline keeps the export on its own line when the existing script
 *   lacks a trailing newline. The script path is resolved through any links the
 *   archive created and must stay under dest_dir both before its parents are
 *   created and after; the final open refuses a symlink.
 */
#include "floability/stages/environment_stager.h"

#include <filesystem>
#include <string>
#include <system_error>

#include "floability/exceptions/path_traversal_error.h"
#include "floability/exceptions/staging_write_error.h"
#include "floability/support/fs.h"
#include "floability/support/log.h"

namespace floability {
namespace stages {

namespace fs = std::filesystem;

static fs::path ResolveInside(const fs::path& root, const fs::path& path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (ec) {
    throw exceptions::StagingWriteError("cannot resolve " + path.string() + ": " + ec.message());
  }
  if (!support::IsWithinDirectory(root, resolved)) {
    throw exceptions::PathTraversalError("activation script resolves outside " + root.string() + ": " +
                                         resolved.string());
  }
  return resolved;
}

auto EnvironmentStager::WriteActivation(const std::string& dest_dir, const std::string& manager_identity) const
    -> void {
  const ScopedTimer timer(Phase::WriteActivation);
  std::error_code ec;
  const fs::path root = fs::canonical(dest_dir, ec);
  if (ec) {
    throw exceptions::StagingWriteError("staged directory is not accessible: " + dest_dir + ": " + ec.message());
  }
  const fs::path script = ResolveInside(root, root / config_.activation_script);
  fs::create_directories(script.parent_path(), ec);
  if (ec) {
    throw exceptions::StagingWriteError("cannot create " + script.parent_path().string() + ": " + ec.message());
  }
  const fs::path parent = ResolveInside(root, script.parent_path());
  const fs::path target = parent / script.filename();

  const std::string line = "\nexport " + config_.identity_variable + "=" + manager_identity + "\n";
  std::string err;
  if (!support::AppendFile(target.string(), line, err)) {
    throw exceptions::StagingWriteError(err);
  }
  support::Log(support::LogLevel::Debug, "stager", "appended " + config_.identity_variable + " to " + target.string());
}

}  // namespace stages
}  // namespace floability
