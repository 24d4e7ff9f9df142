/***
 * Name: floability::process::ChildProcess::ReadOutput
 * Purpose: Return what a child spawned with capture_output wrote.
 * Inputs: none
 * Outputs: Combined stdout/stderr; empty when output was not captured
 * Theory of Operation: Reads to EOF once and releases the pipe, so a second call
 *   returns an empty string. Called by the thread that owns the child, never
 *   under mutex_, so Terminate can still run while the read blocks.
 */
#include "floability/process/handle.h"

#include <string>

#include "floability/process/detail/exec.h"

namespace floability {
namespace process {

auto ChildProcess::ReadOutput() -> std::string {
  std::string out;
  if (!output_.Valid()) {
    return out;
  }
  detail::DrainFd(output_.Get(), out);
  output_.Reset();
  return out;
}

}  // namespace process
}  // namespace floability
