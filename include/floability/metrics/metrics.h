/***
 * Name: floability::metrics::Metrics
 * Purpose: OO metrics interface with static registry. Session stages can inherit
 *   this class and use ScopedTimer plus helper methods to record metrics.
 * Inputs: Phase identifiers and counter increments
 * Outputs: A static registry accessible by the driver for reporting.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 *   Cleanup may run on the signal thread, so recording takes a mutex.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace floability {

namespace metrics {

class Metrics {
 public:
  enum class Phase { Allocate, FetchData, Materialize, Extract, WriteActivation, Fixup, Spawn, Supervise, Cleanup };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    std::map<std::string, std::uint64_t> counters;
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() noexcept {
      const std::lock_guard<std::mutex> lock(mutex_);
      if (!reg_.enabled) return;
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      reg_.durations_ns.emplace_back(phase_, static_cast<std::uint64_t>(ns));
    }
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  static void Enable(bool on) {
    const std::lock_guard<std::mutex> lock(mutex_);
    reg_.enabled = on;
  }
  static Registry Snapshot() {
    const std::lock_guard<std::mutex> lock(mutex_);
    return reg_;
  }
  static void Reset() {
    const std::lock_guard<std::mutex> lock(mutex_);
    reg_ = Registry{reg_.enabled, {}, {}};
  }
  static void Count(const std::string& key, std::uint64_t delta = 1) {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (reg_.enabled) reg_.counters[key] += delta;
  }

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
  static std::mutex mutex_;
};

}  // namespace metrics
}  // namespace floability
