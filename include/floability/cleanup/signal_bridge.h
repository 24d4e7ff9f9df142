/***
 * Name: floability::cleanup::SignalBridge
 * Purpose: Turn SIGINT/SIGTERM/SIGHUP into one cleanup pass followed by process exit.
 * Inputs: The session's CleanupRegistry; an exit function (std::_Exit by default)
 * Outputs: Exit status 128+signal after cleanup completes
 * Theory of Operation: Install() blocks the signals in the calling thread (so every
 *   thread created afterwards inherits the block) and starts a dedicated thread that
 *   waits for them with sigtimedwait. Cleanup therefore runs in ordinary thread
 *   context where locks, allocation, and logging are safe. If the main thread is
 *   already cleaning up, the bridge waits for that pass instead of starting one.
 *   Only one bridge may be installed per process at a time.
 */
#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <thread>
#include <vector>

#include "floability/cleanup/registry.h"

namespace floability {
namespace cleanup {

class SignalBridge {
 public:
  using ExitFunction = std::function<void(int status)>;

  explicit SignalBridge(CleanupRegistry& registry, ExitFunction exit_fn = nullptr);
  ~SignalBridge();
  SignalBridge(const SignalBridge&) = delete;
  SignalBridge& operator=(const SignalBridge&) = delete;

  /*** Install: Block the handled signals and start the waiter; throws SignalSetupError. */
  void Install();

  bool installed() const { return installed_; }
  /*** last_signal: Signal that triggered cleanup, or 0. */
  int last_signal() const { return received_.load(); }

  static std::vector<int> HandledSignals();

 private:
  void WaitLoop();

  CleanupRegistry& registry_;
  ExitFunction exit_fn_;
  bool installed_{false};
  std::atomic<bool> stop_{false};
  std::atomic<int> received_{0};
  sigset_t previous_mask_{};
  std::thread waiter_;
};

}  // namespace cleanup
}  // namespace floability
