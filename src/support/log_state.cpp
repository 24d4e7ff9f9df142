/***
 * Name: floability::support::detail::GetLogSink
 * Purpose: Define the process-wide log sink.
 * Inputs: N/A
 * Outputs: Reference to the single LogSink
 * Theory of Operation: Function-local static so it is constructed before first use,
 *   including from the signal thread.
 */
#include "floability/support/detail/log_sink.h"

namespace floability::support::detail {

LogSink& GetLogSink() {
  static LogSink sink;
  return sink;
}

}  // namespace floability::support::detail
