/***
 * Name: floability::process::RunCommand
 * Purpose: Run a helper command to completion, capturing combined output.
 * Inputs: CommandOptions
 * Outputs: CommandResult; never throws for child failures
 * Theory of Operation: POSIX fork/exec/wait. stdout and stderr share one pipe that
 *   is drained before waitpid so a chatty child cannot deadlock on a full pipe.
 *   Exec failure is reported through the errno pipe and leaves started=false.
 */
#include "floability/process/command.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "floability/process/detail/exec.h"
#include "floability/support/log.h"
#include "floability/support/scoped_fd.h"

namespace floability {
namespace process {

auto RunCommand(const CommandOptions& options) -> CommandResult {
  CommandResult result;
  if (options.argv.empty() || options.argv.front().empty()) {
    result.error = "argv is empty";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.error = std::string("pipe output failed: ") + std::strerror(errno);
    return result;
  }
  support::ScopedFd out_read(out_pipe[0]);
  support::ScopedFd out_write(out_pipe[1]);
  int err_pipe[2] = {-1, -1};
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    result.error = std::string("pipe errno failed: ") + std::strerror(errno);
    return result;
  }
  support::ScopedFd errno_read(err_pipe[0]);
  support::ScopedFd errno_write(err_pipe[1]);
  support::ScopedFd null_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));

  std::vector<std::string> args = options.argv;
  std::vector<char*> argv = detail::BuildArgvMutable(args);
  std::vector<std::string> env_strings = detail::BuildEnvironment(options.env);
  std::vector<char*> envp = detail::BuildArgvMutable(env_strings);

  detail::ChildExec plan;
  plan.argv = argv.data();
  plan.envp = envp.data();
  plan.working_dir = options.working_dir ? options.working_dir->c_str() : nullptr;
  plan.stdin_fd = null_fd.Get();
  plan.stdout_fd = out_write.Get();
  plan.stderr_fd = out_write.Get();
  plan.errno_fd = errno_write.Get();

  support::Log(support::LogLevel::Debug, "process", "running: " + detail::DescribeCommand(options.argv));
  const pid_t pid = ::fork();
  if (pid < 0) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }
  if (pid == 0) {
    detail::ExecChild(plan);
  }
  out_write.Reset();
  errno_write.Reset();

  detail::DrainFd(out_read.Get(), result.output);
  const int child_errno = detail::ReadExecErrno(errno_read.Get());

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.error = std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }
  if (child_errno != 0) {
    result.error = "cannot execute " + options.argv.front() + ": " + std::strerror(child_errno);
    return result;
  }
  result.started = true;
  result.exit_code = detail::DecodeWaitStatus(status);
  return result;
}

}  // namespace process
}  // namespace floability
