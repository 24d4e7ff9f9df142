/***
 * Name: floability::process::RunCommand
 * Purpose: Run a short-lived helper command to completion and capture its output.
 * Inputs: CommandOptions (argv, environment overrides, working directory)
 * Outputs: CommandResult with start status, exit code, and combined stdout/stderr
 * Theory of Operation: fork/exec with both output streams on one pipe, read to EOF,
 *   then waitpid. Used for the environment builder and the data fetcher, whose
 *   output must be surfaced when they fail.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "floability/process/handle.h"

namespace floability {
namespace process {

struct CommandOptions {
  std::vector<std::string> argv;
  std::vector<EnvVar> env;
  std::optional<std::string> working_dir;
};

struct CommandResult {
  bool started{false};
  int exit_code{-1};
  std::string output;
  std::string error;  // why the command could not be started
};

CommandResult RunCommand(const CommandOptions& options);

}  // namespace process
}  // namespace floability
