/***
 * Name: floability::cleanup::CleanupRegistry
 * Purpose: Record every resource a session acquires and release all of them exactly once.
 * Inputs: Process handles and directory paths, registered as they are acquired
 * Outputs: CleanupReport from the single effective Cleanup() pass
 * Theory of Operation: An atomic exchange on started_ elects the one caller that
 *   performs the pass; any other caller (main thread or signal thread) returns at
 *   once and may AwaitCompletion(). The pass terminates processes in registration
 *   order, and only then removes directories in registration order. Failures are
 *   collected in the report and logged; Cleanup() itself never throws.
 *   Registrations that arrive after the pass started are folded into the remaining
 *   phases, or acted on immediately when that phase has already run.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "floability/process/handle.h"

namespace floability {
namespace cleanup {

constexpr std::chrono::milliseconds kDefaultGracePeriod{5000};

struct CleanupReport {
  bool performed{false};  // false when another call already ran the pass
  std::size_t processes_terminated{0};
  std::size_t directories_removed{0};
  std::vector<std::string> errors;

  bool ok() const { return errors.empty(); }
};

class CleanupRegistry {
 public:
  explicit CleanupRegistry(std::chrono::milliseconds grace = kDefaultGracePeriod) : grace_(grace) {}
  CleanupRegistry(const CleanupRegistry&) = delete;
  CleanupRegistry& operator=(const CleanupRegistry&) = delete;

  void RegisterProcess(std::shared_ptr<process::ProcessHandle> handle);
  void RegisterDirectory(const std::string& path);

  /*** Cleanup: Run the release pass on first call; later calls return immediately. */
  CleanupReport Cleanup() noexcept;

  bool CleanupStarted() const noexcept { return started_.load(); }

  /*** AwaitCompletion: Block until a started pass finishes; returns at once if none started. */
  void AwaitCompletion();

  std::chrono::milliseconds grace_period() const { return grace_; }
  std::size_t process_count() const;
  std::size_t directory_count() const;

 private:
  enum class Stage { Idle, Processes, Directories, Done };

  void ReleaseProcess(const std::shared_ptr<process::ProcessHandle>& handle, CleanupReport& report);
  void ReleaseDirectory(const std::string& path, CleanupReport& report);

  std::chrono::milliseconds grace_;
  std::atomic<bool> started_{false};
  mutable std::mutex mutex_;
  std::condition_variable done_cv_;
  Stage stage_{Stage::Idle};
  std::vector<std::shared_ptr<process::ProcessHandle>> processes_;
  std::vector<std::string> directories_;
};

}  // namespace cleanup
}  // namespace floability
