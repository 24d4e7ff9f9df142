/***
 * Name: floability::support::Log
 * Purpose: Emit one diagnostic line for a component.
 * Inputs:
 *   - level: severity
 *   - component: short tag such as "floability", "cleanup", "stager"
 *   - message: text without trailing newline
 * Outputs: Line on the console stream and the mirror file, if any
 * Theory of Operation: Formats "[component] <label>message" and writes it under the
 *   sink mutex so lines from the signal thread never interleave with the main thread.
 */
#include "floability/support/log.h"
#include "floability/support/detail/log_sink.h"

#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace floability::support {

static std::string_view LevelLabel(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug: ";
    case LogLevel::Info: return "";
    case LogLevel::Warning: return "warning: ";
    case LogLevel::Error: return "error: ";
  }
  return "";
}

auto Log(LogLevel level, std::string_view component, std::string_view message) -> void {
  auto& sink = detail::GetLogSink();
  std::string line;
  line.reserve(component.size() + message.size() + 16);
  line += '[';
  line += component;
  line += "] ";
  line += LevelLabel(level);
  line += message;
  line += '\n';

  const std::lock_guard<std::mutex> lock(sink.mutex);
  if (level < sink.threshold) {
    return;
  }
  std::ostream& out = sink.console != nullptr ? *sink.console : std::cerr;
  out << line;
  out.flush();
  if (sink.mirror.is_open()) {
    sink.mirror << line;
    sink.mirror.flush();
  }
}

}  // namespace floability::support
