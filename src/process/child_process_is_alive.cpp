/***
 * Name: floability::process::ChildProcess::IsAlive / ExitCode / Wait / PollExitLocked
 * Purpose: Observe child exit without blocking the supervision thread.
 * Inputs: none
 * Outputs: Liveness flag; exit code once reaped
 * Theory of Operation: waitid(WNOWAIT) detects the exit while leaving the leader a
 *   zombie. Its pid, and so the group id, stay reserved until the waitpid that
 *   follows, which is the one moment the group can be SIGKILLed without risk of
 *   hitting a recycled id. ECHILD means someone else reaped it; treat as gone
 *   and send nothing.
 */
#include "floability/process/handle.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <sys/wait.h>

#include "floability/process/detail/exec.h"
#include "floability/support/log.h"

namespace floability {
namespace process {

auto ChildProcess::PollExitLocked(bool block) -> bool {
  if (reaped_) {
    return true;
  }
  for (;;) {
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT | (block ? 0 : WNOHANG)) == 0) {
      if (info.si_pid == 0) {
        return false;
      }
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    reaped_ = true;  // ECHILD: not ours to wait on any more
    return true;
  }

  if (::kill(-pid_, SIGKILL) != 0 && errno != ESRCH) {
    support::Log(support::LogLevel::Warning, "process",
                 "cannot kill remaining processes of " + label_ + ": " + std::strerror(errno));
  }
  int status = 0;
  pid_t rc = 0;
  while ((rc = ::waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {
  }
  reaped_ = true;
  if (rc == pid_) {
    exit_code_ = detail::DecodeWaitStatus(status);
  }
  return true;
}

auto ChildProcess::IsAlive() -> bool {
  const std::lock_guard<std::mutex> lock(mutex_);
  return !PollExitLocked(false);
}

auto ChildProcess::ExitCode() const -> std::optional<int> {
  const std::lock_guard<std::mutex> lock(mutex_);
  return exit_code_;
}

auto ChildProcess::Wait() -> int {
  // The lock is held per poll only; Terminate may run in between.
  constexpr auto kPollStep = std::chrono::milliseconds(20);
  for (;;) {
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      if (PollExitLocked(false)) {
        return exit_code_.value_or(-1);
      }
    }
    std::this_thread::sleep_for(kPollStep);
  }
}

}  // namespace process
}  // namespace floability
