/***
 * Name: floability::process (handle)
 * Purpose: Handles for long-lived child processes started by a session (provisioner,
 *   interactive server) that the cleanup registry can later terminate.
 * Inputs: SpawnOptions (label, argv, environment overrides, working dir, log file)
 * Outputs: ProcessHandle implementations
 * Theory of Operation: ChildProcess forks, moves the child into its own process
 *   group, and execs. Exec failure is reported back over a close-on-exec pipe so
 *   Spawn either returns a running child or throws SpawnError. Liveness is polled
 *   with waitid(WNOHANG); termination escalates SIGTERM -> SIGKILL to the group.
 *   Group members that outlive the leader are killed once, when it is reaped.
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

#include "floability/support/scoped_fd.h"

namespace floability {
namespace process {

struct EnvVar {
  std::string key;
  std::string value;
};

struct SpawnOptions {
  std::string label;
  std::vector<std::string> argv;
  std::vector<EnvVar> env;
  std::optional<std::string> working_dir;
  std::optional<std::string> log_path;  // stdout+stderr appended here; inherited when unset
  bool capture_output{false};           // stdout+stderr readable via ReadOutput(); overrides log_path
};

class ProcessHandle {
 public:
  virtual ~ProcessHandle() = default;

  virtual const std::string& Label() const = 0;
  virtual pid_t Pid() const = 0;
  /*** IsAlive: Non-blocking liveness check; reaps the child when it has exited. */
  virtual bool IsAlive() = 0;
  /*** Terminate: Graceful stop, forced after grace. No-op once exited. Throws TerminationError. */
  virtual void Terminate(std::chrono::milliseconds grace) = 0;
  /*** ExitCode: Exit status once reaped (128+N when killed by signal N). */
  virtual std::optional<int> ExitCode() const = 0;
};

class ChildProcess final : public ProcessHandle {
 public:
  /*** Spawn: Start the child asynchronously; throws SpawnError if it cannot be started. */
  static std::shared_ptr<ChildProcess> Spawn(const SpawnOptions& options);

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  const std::string& Label() const override { return label_; }
  pid_t Pid() const override { return pid_; }
  bool IsAlive() override;
  void Terminate(std::chrono::milliseconds grace) override;
  std::optional<int> ExitCode() const override;

  /*** ReadOutput: Captured stdout+stderr until every writer in the group closes it. */
  std::string ReadOutput();

  /*** Wait: Block until the child is reaped; -1 when its status was collected elsewhere. */
  int Wait();

 private:
  ChildProcess(std::string label, pid_t pid, support::ScopedFd output)
      : label_(std::move(label)), pid_(pid), output_(std::move(output)) {}

  // Caller holds mutex_. Returns true once the child has been reaped. The group
  // is SIGKILLed while the exited leader is still a zombie, so its id cannot
  // have been reused by then.
  bool PollExitLocked(bool block);

  std::string label_;
  pid_t pid_;
  support::ScopedFd output_;
  mutable std::mutex mutex_;
  bool reaped_{false};
  std::optional<int> exit_code_;
};

}  // namespace process
}  // namespace floability
