/***
 * Name: floability::support::SetLogStream
 * Purpose: Redirect console log output, mainly so tests can capture it.
 * Inputs: out (nullptr restores std::cerr)
 * Outputs: None
 */
#include "floability/support/log.h"
#include "floability/support/detail/log_sink.h"

#include <mutex>
#include <ostream>

namespace floability::support {

auto SetLogStream(std::ostream* out) -> void {
  auto& sink = detail::GetLogSink();
  const std::lock_guard<std::mutex> lock(sink.mutex);
  sink.console = out;
}

}  // namespace floability::support
