/***
 * Name: floability::process::detail::ExecChild / ReadExecErrno
 * Purpose: The two halves of the exec handshake between a forked child and its parent.
 * Inputs: ChildExec plan prepared before fork; the read end of the errno pipe
 * Outputs: Child: exec or _exit(127) after reporting errno. Parent: child errno or 0.
 * Theory of Operation: The session blocks SIGINT/SIGTERM/SIGHUP for its signal thread
 *   and the mask survives exec, so the child restores an empty mask and default
 *   dispositions before exec. Only async-signal-safe calls are made in the child.
 */
#include "floability/process/detail/exec.h"

#include <cerrno>
#include <csignal>
#include <initializer_list>

#include <unistd.h>

namespace floability {
namespace process {
namespace detail {

static void ReportAndExit(int errno_fd) noexcept {
  constexpr int kExecFailure = 127;
  const int code = errno;
  if (errno_fd >= 0) {
    const ssize_t n = ::write(errno_fd, &code, sizeof(code));
    static_cast<void>(n);
  }
  _exit(kExecFailure);
}

void ExecChild(const ChildExec& plan) noexcept {
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  for (const int sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE}) {
    signal(sig, SIG_DFL);
  }
  if (plan.new_process_group && setpgid(0, 0) != 0) {
    ReportAndExit(plan.errno_fd);
  }
  if (plan.stdin_fd >= 0 && dup2(plan.stdin_fd, STDIN_FILENO) < 0) {
    ReportAndExit(plan.errno_fd);
  }
  if (plan.stdout_fd >= 0 && dup2(plan.stdout_fd, STDOUT_FILENO) < 0) {
    ReportAndExit(plan.errno_fd);
  }
  if (plan.stderr_fd >= 0 && dup2(plan.stderr_fd, STDERR_FILENO) < 0) {
    ReportAndExit(plan.errno_fd);
  }
  if (plan.working_dir != nullptr && chdir(plan.working_dir) != 0) {
    ReportAndExit(plan.errno_fd);
  }
  execvpe(plan.argv[0], plan.argv, plan.envp);
  ReportAndExit(plan.errno_fd);
}

auto ReadExecErrno(int errno_fd) -> int {
  int code = 0;
  for (;;) {
    const ssize_t n = ::read(errno_fd, &code, sizeof(code));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    return n == static_cast<ssize_t>(sizeof(code)) ? code : 0;
  }
}

}  // namespace detail
}  // namespace process
}  // namespace floability
