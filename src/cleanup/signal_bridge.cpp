/***
 * Name: floability::cleanup::SignalBridge
 * Purpose: Signal-to-cleanup bridge implementation.
 * Inputs: Registry and exit function
 * Outputs: Cleanup on SIGINT/SIGTERM/SIGHUP, then exit_fn(128+signal)
 * Theory of Operation: sigtimedwait with a short timeout lets the waiter notice
 *   stop_ during destruction. The destructor joins the waiter and restores the
 *   signal mask that was in effect before Install().
 */
#include "floability/cleanup/signal_bridge.h"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>

#include "floability/exceptions/signal_setup_error.h"
#include "floability/support/log.h"

namespace floability {
namespace cleanup {

static std::atomic<bool> g_bridge_active{false};

static sigset_t HandledSet() {
  sigset_t set;
  sigemptyset(&set);
  for (const int sig : SignalBridge::HandledSignals()) {
    sigaddset(&set, sig);
  }
  return set;
}

SignalBridge::SignalBridge(CleanupRegistry& registry, ExitFunction exit_fn)
    : registry_(registry), exit_fn_(std::move(exit_fn)) {
  if (!exit_fn_) {
    exit_fn_ = [](int status) { std::_Exit(status); };
  }
}

auto SignalBridge::HandledSignals() -> std::vector<int> { return {SIGINT, SIGTERM, SIGHUP}; }

auto SignalBridge::Install() -> void {
  if (installed_ || g_bridge_active.exchange(true)) {
    throw exceptions::SignalSetupError("signal bridge is already installed");
  }
  const sigset_t set = HandledSet();
  const int rc = pthread_sigmask(SIG_BLOCK, &set, &previous_mask_);
  if (rc != 0) {
    g_bridge_active.store(false);
    throw exceptions::SignalSetupError(std::string("pthread_sigmask failed: ") + std::strerror(rc));
  }
  installed_ = true;
  waiter_ = std::thread([this] { WaitLoop(); });
}

auto SignalBridge::WaitLoop() -> void {
  const sigset_t set = HandledSet();
  constexpr long kWaitSliceNs = 100L * 1000L * 1000L;
  while (!stop_.load()) {
    const timespec slice{0, kWaitSliceNs};
    siginfo_t info{};
    const int sig = sigtimedwait(&set, &info, &slice);
    if (sig < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;
      }
      support::Log(support::LogLevel::Error, "signal", std::string("sigtimedwait failed: ") + std::strerror(errno));
      return;
    }
    received_.store(sig);
    support::Log(support::LogLevel::Warning, "signal",
                 std::string("received ") + strsignal(sig) + "; cleaning up before exit");
    const CleanupReport report = registry_.Cleanup();
    if (!report.performed) {
      registry_.AwaitCompletion();
    }
    constexpr int kSignalExitBase = 128;
    exit_fn_(kSignalExitBase + sig);
    return;
  }
}

SignalBridge::~SignalBridge() {
  if (!installed_) {
    return;
  }
  stop_.store(true);
  if (waiter_.joinable()) {
    waiter_.join();
  }
  pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
  g_bridge_active.store(false);
}

}  // namespace cleanup
}  // namespace floability
