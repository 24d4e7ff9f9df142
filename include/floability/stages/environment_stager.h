/***
 * Name: floability::stages::EnvironmentStager
 * Purpose: Stage class that turns a packed environment archive into a usable prefix.
 * Inputs: Archive path, destination directory, manager identity
 * Outputs: Extracted environment with the manager identity exported on activation
 * Theory of Operation: Three commit points, each with its own error type:
 *   extract (ExtractionError / PathTraversalError), append the activation export
 *   (StagingWriteError), run the relocation fixup (FixupError with its output).
 *   The caller registers dest_dir for cleanup before calling and cleans up on throw.
 *   The fixup tool works inside dest_dir, so when a registry is supplied it is
 *   registered there too and is stopped before dest_dir is removed.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "floability/cleanup/registry.h"
#include "floability/metrics/metrics.h"

namespace floability {
namespace stages {

struct StagerConfig {
  // Relative to the staged directory.
  std::string activation_script{"etc/conda/activate.d/env_vars.sh"};
  std::string identity_variable{"VINE_MANAGER_NAME"};
  // "{prefix}" is replaced with the staged directory. Empty disables the step.
  std::vector<std::string> fixup_command{"conda", "run", "--prefix", "{prefix}", "--no-capture-output",
                                         "conda-unpack"};
};

class EnvironmentStager : public metrics::Metrics {
 public:
  EnvironmentStager() = default;
  explicit EnvironmentStager(StagerConfig config) : config_(std::move(config)) {}
  /*** Fixup children are registered with registry so a cleanup pass stops them first. */
  EnvironmentStager(StagerConfig config, cleanup::CleanupRegistry& registry)
      : config_(std::move(config)), registry_(&registry) {}

  /*** Stage: Extract, write activation, fix up. Throws the step's error type. */
  void Stage(const std::string& archive_path, const std::string& dest_dir, const std::string& manager_identity);

  /*** WriteActivation: Append the identity export to the activation script. */
  void WriteActivation(const std::string& dest_dir, const std::string& manager_identity) const;

  /*** RunFixup: Run the fixup command scoped to dest_dir. */
  void RunFixup(const std::string& dest_dir) const;

  const StagerConfig& config() const { return config_; }

 private:
  StagerConfig config_;
  cleanup::CleanupRegistry* registry_{nullptr};
};

}  // namespace stages
}  // namespace floability
