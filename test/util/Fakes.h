/***
 * Name: testutil (fakes)
 * Purpose: Fake process handles and session collaborators with call counters.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "floability/exceptions/termination_error.h"
#include "floability/launch/collaborators.h"
#include "floability/launch/launchers.h"
#include "floability/process/handle.h"

namespace testutil {

// Shared, thread-safe log of events ("terminate:vine_factory", "remove:...").
class EventLog {
 public:
  void Add(std::string event) {
    const std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
  }
  std::vector<std::string> Events() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> events_;
};

class FakeProcess final : public floability::process::ProcessHandle {
 public:
  explicit FakeProcess(std::string label, EventLog* log = nullptr) : label_(std::move(label)), log_(log) {}

  const std::string& Label() const override { return label_; }
  pid_t Pid() const override { return 0; }
  bool IsAlive() override {
    ++is_alive_calls;
    if (on_poll) on_poll();
    return alive.load();
  }
  void Terminate(std::chrono::milliseconds grace) override {
    ++terminate_calls;
    last_grace = grace;
    if (log_ != nullptr) log_->Add("terminate:" + label_);
    if (on_terminate) on_terminate();
    if (terminate_delay.count() > 0) std::this_thread::sleep_for(terminate_delay);
    if (throw_on_terminate) throw floability::exceptions::TerminationError("cannot signal " + label_);
    if (dies_on_terminate) alive.store(false);
  }
  std::optional<int> ExitCode() const override {
    if (alive.load()) return std::nullopt;
    return exit_code;
  }

  std::atomic<bool> alive{true};
  std::atomic<int> terminate_calls{0};
  std::atomic<int> is_alive_calls{0};
  bool dies_on_terminate{true};
  bool throw_on_terminate{false};
  std::chrono::milliseconds last_grace{-1};
  std::function<void()> on_poll;
  std::function<void()> on_terminate;
  int exit_code{0};
  std::chrono::milliseconds terminate_delay{0};

 private:
  std::string label_;
  EventLog* log_;
};

class FakeLaunchers final : public floability::launch::SessionLaunchers {
 public:
  std::shared_ptr<floability::process::ProcessHandle> LaunchProvisioner(
      const floability::launch::ProvisionerRequest& request) override {
    ++provisioner_calls;
    last_provisioner = request;
    return provisioner;
  }
  std::shared_ptr<floability::process::ProcessHandle> LaunchSession(
      const floability::launch::SessionRequest& request) override {
    ++session_calls;
    last_session = request;
    return session;
  }

  std::shared_ptr<FakeProcess> provisioner = std::make_shared<FakeProcess>("vine_factory");
  std::shared_ptr<FakeProcess> session = std::make_shared<FakeProcess>("jupyter");
  int provisioner_calls{0};
  int session_calls{0};
  floability::launch::ProvisionerRequest last_provisioner;
  floability::launch::SessionRequest last_session;
};

class FakeMaterializer final : public floability::launch::EnvironmentMaterializer {
 public:
  std::string Materialize(const std::string& description, const std::string& manager_identity,
                          const std::string& /*run_dir*/) override {
    ++calls;
    last_description = description;
    last_identity = manager_identity;
    return archive;
  }
  std::string archive;
  int calls{0};
  std::string last_description;
  std::string last_identity;
};

class FakeDataFetcher final : public floability::launch::DataFetcher {
 public:
  void Fetch(const std::string& spec_path, const std::string& root_path) override {
    ++calls;
    last_spec = spec_path;
    last_root = root_path;
  }
  int calls{0};
  std::string last_spec;
  std::string last_root;
};

}  // namespace testutil
