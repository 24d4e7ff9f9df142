/***
 * Name: floability::process::detail (exec)
 * Purpose: fork/exec plumbing shared by ChildProcess and RunCommand.
 * Inputs: argv and environment as strings
 * Outputs: Pointer arrays for execvpe; decoded wait statuses; child-side exec
 * Theory of Operation: Everything the child needs is built before fork so the
 *   child only makes async-signal-safe calls between fork and exec.
 */
#pragma once

#include <string>
#include <vector>

#include "floability/process/handle.h"

namespace floability {
namespace process {
namespace detail {

/*** BuildArgvMutable: Null-terminated pointer array over args (args must outlive it). */
std::vector<char*> BuildArgvMutable(std::vector<std::string>& args);

/*** BuildEnvironment: Current environ with overrides applied, as KEY=VALUE strings. */
std::vector<std::string> BuildEnvironment(const std::vector<EnvVar>& overrides);

/*** DescribeCommand: Space-joined argv for diagnostics. */
std::string DescribeCommand(const std::vector<std::string>& argv);

/*** DrainFd: Append everything readable from fd to out until EOF or a read error. */
void DrainFd(int fd, std::string& out);

/*** DecodeWaitStatus: Exit status, or 128+signal for signaled children. */
int DecodeWaitStatus(int status);

struct ChildExec {
  char** argv{nullptr};
  char** envp{nullptr};
  const char* working_dir{nullptr};
  int stdin_fd{-1};
  int stdout_fd{-1};
  int stderr_fd{-1};
  int errno_fd{-1};  // close-on-exec; receives errno if exec fails
  bool new_process_group{false};
};

/*** ExecChild: Child side after fork; never returns. */
[[noreturn]] void ExecChild(const ChildExec& plan) noexcept;

/*** ReadExecErrno: Parent side; 0 when exec succeeded (pipe closed), else child errno. */
int ReadExecErrno(int errno_fd);

}  // namespace detail
}  // namespace process
}  // namespace floability
