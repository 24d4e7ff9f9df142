/***
 * Name: floability::stages::EnvironmentStager::Stage
 * Purpose: Run the three staging steps in order.
 * Inputs: archive_path, dest_dir (already created and registered), manager_identity
 * Outputs: Staged environment; throws on the first failing step
 * Theory of Operation: No step is retried; the first exception propagates.
 */
#include "floability/stages/environment_stager.h"

#include <string>

#include "floability/archive/extractor.h"
#include "floability/support/log.h"

namespace floability {
namespace stages {

auto EnvironmentStager::Stage(const std::string& archive_path, const std::string& dest_dir,
                              const std::string& manager_identity) -> void {
  support::Log(support::LogLevel::Info, "stager", "extracting " + archive_path + " into " + dest_dir);
  archive::ExtractArchive(archive_path, dest_dir);
  WriteActivation(dest_dir, manager_identity);
  RunFixup(dest_dir);
  support::Log(support::LogLevel::Info, "stager", "environment ready at " + dest_dir);
}

}  // namespace stages
}  // namespace floability
