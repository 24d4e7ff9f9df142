/***
 * Name: floability::process::ChildProcess::Terminate
 * Purpose: Stop the child's process group, gracefully first.
 * Inputs: grace - how long to wait after SIGTERM before SIGKILL
 * Outputs: Child reaped on return; throws TerminationError if it cannot be signaled
 * Theory of Operation: SIGTERM to the group, poll every 50ms until the leader exits
 *   or grace elapses, then SIGKILL and a blocking wait. Group members that outlive
 *   the leader are killed as part of reaping it (see PollExitLocked). Once the
 *   child is reaped, further calls send no signal at all.
 */
#include "floability/process/handle.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>

#include "floability/exceptions/termination_error.h"
#include "floability/support/log.h"

namespace floability {
namespace process {

static bool SignalGroup(pid_t pid, int sig) {
  if (::kill(-pid, sig) == 0) {
    return true;
  }
  if (errno == ESRCH) {
    // The group may not exist if the child had not reached setpgid yet.
    return ::kill(pid, sig) == 0 || errno == ESRCH;
  }
  return false;
}

auto ChildProcess::Terminate(std::chrono::milliseconds grace) -> void {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (PollExitLocked(false)) {
    return;
  }
  support::Log(support::LogLevel::Info, "process", "terminating " + label_ + " (pid " + std::to_string(pid_) + ")");
  if (!SignalGroup(pid_, SIGTERM)) {
    throw exceptions::TerminationError("cannot signal " + label_ + " (pid " + std::to_string(pid_) +
                                       "): " + std::strerror(errno));
  }

  constexpr auto kPollStep = std::chrono::milliseconds(50);
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (!PollExitLocked(false)) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kPollStep, deadline - now));
  }

  if (!reaped_) {
    support::Log(support::LogLevel::Warning, "process",
                 label_ + " did not exit within grace period; sending SIGKILL");
    if (!SignalGroup(pid_, SIGKILL)) {
      throw exceptions::TerminationError("cannot kill " + label_ + " (pid " + std::to_string(pid_) +
                                         "): " + std::strerror(errno));
    }
    PollExitLocked(true);
  }
}

}  // namespace process
}  // namespace floability
