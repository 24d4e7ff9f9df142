/***
 * Name: floability::cleanup::CleanupRegistry::Cleanup
 * Purpose: The single release pass: all processes first, then all directories.
 * Inputs: none
 * Outputs: CleanupReport (performed=false for every call but the first)
 * Theory of Operation: started_.exchange(true) is the one-shot test-and-set. Lists
 *   are read by index under the lock so late registrations are picked up. A
 *   process that still reports alive after Terminate is recorded as an error;
 *   directories are removed afterwards regardless, since cleanup is best-effort.
 */
#include "floability/cleanup/registry.h"

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

#include "floability/metrics/metrics.h"
#include "floability/support/fs.h"
#include "floability/support/log.h"

namespace floability {
namespace cleanup {

auto CleanupRegistry::ReleaseProcess(const std::shared_ptr<process::ProcessHandle>& handle, CleanupReport& report)
    -> void {
  try {
    handle->Terminate(grace_);
    if (handle->IsAlive()) {
      report.errors.push_back("process " + handle->Label() + " still alive after terminate");
      support::Log(support::LogLevel::Error, "cleanup", report.errors.back());
      return;
    }
    ++report.processes_terminated;
  } catch (const std::exception& e) {
    report.errors.push_back("terminate " + handle->Label() + ": " + e.what());
    support::Log(support::LogLevel::Error, "cleanup", report.errors.back());
  }
}

auto CleanupRegistry::ReleaseDirectory(const std::string& path, CleanupReport& report) -> void {
  std::string err;
  if (!support::RemoveTree(path, err)) {
    report.errors.push_back(err);
    support::Log(support::LogLevel::Error, "cleanup", err);
    return;
  }
  ++report.directories_removed;
  support::Log(support::LogLevel::Debug, "cleanup", "removed " + path);
}

auto CleanupRegistry::Cleanup() noexcept -> CleanupReport {
  CleanupReport report;
  if (started_.exchange(true)) {
    return report;
  }
  report.performed = true;
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Cleanup);
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      stage_ = Stage::Processes;
    }
    support::Log(support::LogLevel::Info, "cleanup", "releasing session resources");

    for (std::size_t i = 0;; ++i) {
      std::shared_ptr<process::ProcessHandle> handle;
      {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (i >= processes_.size()) {
          stage_ = Stage::Directories;
          break;
        }
        handle = processes_[i];
      }
      ReleaseProcess(handle, report);
    }

    for (std::size_t i = 0;; ++i) {
      std::string path;
      {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (i >= directories_.size()) {
          stage_ = Stage::Done;
          break;
        }
        path = directories_[i];
      }
      ReleaseDirectory(path, report);
    }
  }

  metrics::Metrics::Count("cleanup.processes", report.processes_terminated);
  metrics::Metrics::Count("cleanup.directories", report.directories_removed);
  if (!report.errors.empty()) {
    metrics::Metrics::Count("cleanup.errors", report.errors.size());
    support::Log(support::LogLevel::Warning, "cleanup",
                 "cleanup finished with " + std::to_string(report.errors.size()) + " error(s)");
  }
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    done_cv_.notify_all();
  }
  return report;
}

auto CleanupRegistry::AwaitCompletion() -> void {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait(lock, [this] { return !started_.load() || stage_ == Stage::Done; });
}

}  // namespace cleanup
}  // namespace floability
