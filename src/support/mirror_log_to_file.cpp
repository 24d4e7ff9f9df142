/***
 * Name: floability::support::MirrorLogToFile
 * Purpose: Keep a copy of every log line in a file (the run directory log).
 * Inputs:
 *   - path: file to append to; empty closes the current mirror
 * Outputs:
 *   - err: error text when the file cannot be opened
 * Theory of Operation: Replaces the sink's mirror stream under the sink mutex.
 */
#include "floability/support/log.h"
#include "floability/support/detail/log_sink.h"

#include <ios>
#include <mutex>
#include <string>

namespace floability::support {

auto MirrorLogToFile(const std::string& path, std::string& err) -> bool {
  auto& sink = detail::GetLogSink();
  const std::lock_guard<std::mutex> lock(sink.mutex);
  if (sink.mirror.is_open()) {
    sink.mirror.close();
  }
  if (path.empty()) {
    return true;
  }
  sink.mirror.clear();
  sink.mirror.open(path, std::ios::app);
  if (!sink.mirror.is_open()) {
    err = "failed to open log file: " + path;
    return false;
  }
  return true;
}

}  // namespace floability::support
