/***
 * Name: floability::cleanup::CleanupRegistry (registration)
 * Purpose: Append release obligations; handle registrations racing with cleanup.
 * Inputs: Process handle or directory path
 * Outputs: none
 * Theory of Operation: While the matching phase of the pass has not run yet the
 *   obligation is queued. Otherwise it is released right here, on the caller's
 *   thread, so nothing registered during shutdown is leaked.
 */
#include "floability/cleanup/registry.h"

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "floability/support/log.h"

namespace floability {
namespace cleanup {

auto CleanupRegistry::RegisterProcess(std::shared_ptr<process::ProcessHandle> handle) -> void {
  if (!handle) {
    return;
  }
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (stage_ == Stage::Idle || stage_ == Stage::Processes) {
      processes_.push_back(std::move(handle));
      return;
    }
  }
  support::Log(support::LogLevel::Warning, "cleanup",
               "process " + handle->Label() + " registered after cleanup; terminating now");
  CleanupReport late;
  ReleaseProcess(handle, late);
}

auto CleanupRegistry::RegisterDirectory(const std::string& path) -> void {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (stage_ != Stage::Done) {
      directories_.push_back(path);
      return;
    }
  }
  support::Log(support::LogLevel::Warning, "cleanup", "directory " + path + " registered after cleanup; removing now");
  CleanupReport late;
  ReleaseDirectory(path, late);
}

auto CleanupRegistry::process_count() const -> std::size_t {
  const std::lock_guard<std::mutex> lock(mutex_);
  return processes_.size();
}

auto CleanupRegistry::directory_count() const -> std::size_t {
  const std::lock_guard<std::mutex> lock(mutex_);
  return directories_.size();
}

}  // namespace cleanup
}  // namespace floability
