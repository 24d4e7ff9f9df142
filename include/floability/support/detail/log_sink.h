/***
 * Name: floability::support::detail::LogSink
 * Purpose: Shared state behind the Log() family of functions.
 * Inputs: N/A
 * Outputs: Singleton-style storage for log configuration
 * Theory of Operation: One definition lives in log_state.cpp; every accessor takes mutex.
 */
#pragma once

#include <fstream>
#include <mutex>
#include <ostream>

#include "floability/support/log.h"

namespace floability {
namespace support {
namespace detail {

struct LogSink {
  std::mutex mutex;
  LogLevel threshold{LogLevel::Info};
  std::ostream* console{nullptr};  // nullptr means std::cerr
  std::ofstream mirror;
};

LogSink& GetLogSink();

}  // namespace detail
}  // namespace support
}  // namespace floability
