/***
 * Name: floability::stages::EnvironmentStager::RunFixup
 * Purpose: Rewrite build-time absolute paths inside the staged environment.
 * Inputs: dest_dir
 * Outputs: none; throws FixupError carrying the tool's combined output
 * Theory of Operation: Substitutes {prefix} in the configured command and starts
 *   it in its own process group with the staged directory as working directory.
 *   The child is registered before its output is read, so a cleanup pass that
 *   starts meanwhile terminates it before removing the directory it works in.
 */
#include "floability/stages/environment_stager.h"

#include <memory>
#include <string>
#include <vector>

#include "floability/exceptions/fixup_error.h"
#include "floability/exceptions/spawn_error.h"
#include "floability/process/handle.h"
#include "floability/support/log.h"

namespace floability {
namespace stages {

static std::string SubstitutePrefix(std::string arg, const std::string& prefix) {
  static const std::string kToken = "{prefix}";
  for (auto pos = arg.find(kToken); pos != std::string::npos; pos = arg.find(kToken, pos + prefix.size())) {
    arg.replace(pos, kToken.size(), prefix);
  }
  return arg;
}

auto EnvironmentStager::RunFixup(const std::string& dest_dir) const -> void {
  if (config_.fixup_command.empty()) {
    support::Log(support::LogLevel::Debug, "stager", "no fixup command configured");
    return;
  }
  const ScopedTimer timer(Phase::Fixup);
  process::SpawnOptions options;
  options.label = "fixup";
  for (const auto& arg : config_.fixup_command) {
    options.argv.push_back(SubstitutePrefix(arg, dest_dir));
  }
  options.working_dir = dest_dir;
  options.capture_output = true;

  std::shared_ptr<process::ChildProcess> child;
  try {
    child = process::ChildProcess::Spawn(options);
  } catch (const exceptions::SpawnError& e) {
    throw exceptions::FixupError(std::string("fixup command could not be started: ") + e.what(), -1, "");
  }
  if (registry_ != nullptr) {
    registry_->RegisterProcess(child);
  }
  const std::string output = child->ReadOutput();
  const int exit_code = child->Wait();

  if (registry_ != nullptr && registry_->CleanupStarted()) {
    throw exceptions::FixupError("fixup interrupted by cleanup", exit_code, output);
  }
  if (exit_code != 0) {
    throw exceptions::FixupError("fixup command failed with status " + std::to_string(exit_code), exit_code, output);
  }
  if (!output.empty()) {
    support::Log(support::LogLevel::Debug, "stager", "fixup output:\n" + output);
  }
}

}  // namespace stages
}  // namespace floability
