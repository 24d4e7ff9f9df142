/***
 * Name: floability::supervise::SupervisionLoop
 * Purpose: Polling state machine over the two session children.
 * Inputs: See loop.h
 * Outputs: SupervisionResult
 * Theory of Operation: Sleep, then check the provisioner before the session. The
 *   default sleeper waits in short slices so an interruption is seen promptly
 *   instead of after a full interval.
 */
#include "floability/supervise/loop.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "floability/metrics/metrics.h"
#include "floability/support/log.h"

namespace floability {
namespace supervise {

auto StateName(SupervisionState state) -> const char* {
  switch (state) {
    case SupervisionState::Running: return "running";
    case SupervisionState::ProvisionerExited: return "provisioner-exited";
    case SupervisionState::SessionExited: return "session-exited";
    case SupervisionState::Done: return "done";
  }
  return "unknown";
}

static std::string ExitText(const process::ProcessHandle& handle) {
  const auto code = handle.ExitCode();
  return code ? " with status " + std::to_string(*code) : std::string();
}

SupervisionLoop::SupervisionLoop(cleanup::CleanupRegistry& registry,
                                 std::shared_ptr<process::ProcessHandle> provisioner,
                                 std::shared_ptr<process::ProcessHandle> session, std::chrono::milliseconds interval,
                                 Sleeper sleeper)
    : registry_(registry),
      provisioner_(std::move(provisioner)),
      session_(std::move(session)),
      interval_(interval),
      sleeper_(std::move(sleeper)) {}

auto SupervisionLoop::DefaultSleep(std::chrono::milliseconds interval) const -> void {
  constexpr auto kSlice = std::chrono::milliseconds(100);
  const auto deadline = std::chrono::steady_clock::now() + interval;
  while (!registry_.CleanupStarted()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSlice, deadline - now));
  }
}

auto SupervisionLoop::Transition(SupervisionState next) -> void {
  support::Log(support::LogLevel::Debug, "supervise",
               std::string("state ") + StateName(state_) + " -> " + StateName(next));
  state_ = next;
}

auto SupervisionLoop::Run() -> SupervisionResult {
  SupervisionResult result;
  try {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Supervise);
    for (;;) {
      if (sleeper_) {
        sleeper_(interval_);
      } else {
        DefaultSleep(interval_);
      }
      if (registry_.CleanupStarted()) {
        result.outcome = SupervisionOutcome::Interrupted;
        support::Log(support::LogLevel::Info, "supervise", "interrupted; stopping supervision");
        break;
      }
      ++result.polls;
      if (provisioner_ && !provisioner_->IsAlive()) {
        Transition(SupervisionState::ProvisionerExited);
        result.outcome = SupervisionOutcome::ProvisionerExited;
        support::Log(support::LogLevel::Info, "supervise",
                     provisioner_->Label() + " exited" + ExitText(*provisioner_) + "; ending session");
        break;
      }
      if (!result.session_exited && session_ && !session_->IsAlive()) {
        Transition(SupervisionState::SessionExited);
        result.session_exited = true;
        support::Log(support::LogLevel::Info, "supervise",
                     session_->Label() + " exited" + ExitText(*session_) + "; provisioner keeps running");
      }
    }
  } catch (const std::exception& e) {
    Transition(SupervisionState::Done);
    support::Log(support::LogLevel::Error, "supervise", std::string("supervision failed: ") + e.what());
    registry_.Cleanup();
    throw;
  }
  metrics::Metrics::Count("supervise.polls", result.polls);
  Transition(SupervisionState::Done);
  result.cleanup = registry_.Cleanup();
  return result;
}

}  // namespace supervise
}  // namespace floability
