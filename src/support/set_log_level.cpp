/***
 * Name: floability::support::SetLogLevel
 * Purpose: Change the minimum severity that Log() emits.
 * Inputs: level
 * Outputs: None
 */
#include "floability/support/log.h"
#include "floability/support/detail/log_sink.h"

#include <mutex>

namespace floability::support {

auto SetLogLevel(LogLevel level) -> void {
  auto& sink = detail::GetLogSink();
  const std::lock_guard<std::mutex> lock(sink.mutex);
  sink.threshold = level;
}

}  // namespace floability::support
