/***
 * Name: floability::process::ChildProcess::Spawn
 * Purpose: Start a long-lived child without waiting for it.
 * Inputs: SpawnOptions
 * Outputs: shared_ptr<ChildProcess> for a child that has successfully exec'd
 * Theory of Operation: The log file (or capture pipe), /dev/null stdin, argv, and
 *   environment are prepared before fork. The parent blocks only until the errno pipe closes (exec
 *   succeeded) or delivers an errno (exec failed, child reaped, SpawnError thrown).
 */
#include "floability/process/handle.h"

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "floability/exceptions/spawn_error.h"
#include "floability/metrics/metrics.h"
#include "floability/process/detail/exec.h"
#include "floability/support/log.h"
#include "floability/support/scoped_fd.h"

namespace floability {
namespace process {

auto ChildProcess::Spawn(const SpawnOptions& options) -> std::shared_ptr<ChildProcess> {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Spawn);
  if (options.argv.empty() || options.argv.front().empty()) {
    throw exceptions::SpawnError("cannot start " + options.label + ": empty command");
  }

  support::ScopedFd log_fd;
  support::ScopedFd output_read;
  if (options.capture_output) {
    int out_fds[2] = {-1, -1};
    if (::pipe2(out_fds, O_CLOEXEC) != 0) {
      throw exceptions::SpawnError(std::string("output pipe failed: ") + std::strerror(errno));
    }
    output_read.Reset(out_fds[0]);
    log_fd.Reset(out_fds[1]);
  } else if (options.log_path) {
    log_fd.Reset(::open(options.log_path->c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (!log_fd.Valid()) {
      throw exceptions::SpawnError("cannot open log file for " + options.label + ": " + *options.log_path + ": " +
                                   std::strerror(errno));
    }
  }
  support::ScopedFd null_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (!null_fd.Valid()) {
    throw exceptions::SpawnError(std::string("cannot open /dev/null: ") + std::strerror(errno));
  }
  int pipe_fds[2] = {-1, -1};
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    throw exceptions::SpawnError(std::string("pipe failed: ") + std::strerror(errno));
  }
  support::ScopedFd err_read(pipe_fds[0]);
  support::ScopedFd err_write(pipe_fds[1]);

  std::vector<std::string> args = options.argv;
  std::vector<char*> argv = detail::BuildArgvMutable(args);
  std::vector<std::string> env_strings = detail::BuildEnvironment(options.env);
  std::vector<char*> envp = detail::BuildArgvMutable(env_strings);

  detail::ChildExec plan;
  plan.argv = argv.data();
  plan.envp = envp.data();
  plan.working_dir = options.working_dir ? options.working_dir->c_str() : nullptr;
  plan.stdin_fd = null_fd.Get();
  plan.stdout_fd = log_fd.Get();
  plan.stderr_fd = log_fd.Get();
  plan.errno_fd = err_write.Get();
  plan.new_process_group = true;

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw exceptions::SpawnError("failed to fork() for " + options.label + ": " + std::strerror(errno));
  }
  if (pid == 0) {
    detail::ExecChild(plan);
  }
  // Also set from the parent so the group exists before Terminate can signal it.
  if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
    support::Log(support::LogLevel::Debug, "process",
                 "setpgid(" + std::to_string(pid) + ") failed: " + std::strerror(errno));
  }
  err_write.Reset();
  log_fd.Reset();

  const int child_errno = detail::ReadExecErrno(err_read.Get());
  if (child_errno != 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    throw exceptions::SpawnError("failed to start " + options.label + " (" + options.argv.front() +
                                 "): " + std::strerror(child_errno));
  }

  metrics::Metrics::Count("process.spawned");
  support::Log(support::LogLevel::Info, "process",
               "started " + options.label + " (pid " + std::to_string(pid) + "): " +
                   detail::DescribeCommand(options.argv));
  return std::shared_ptr<ChildProcess>(new ChildProcess(options.label, pid, std::move(output_read)));
}

}  // namespace process
}  // namespace floability
