/***
 * Name: floability::support (log)
 * Purpose: Process-wide diagnostic output for the session driver and its components.
 * Inputs: Level, component tag, message text
 * Outputs: Lines on stderr (or a redirected stream) and optionally mirrored to a log file
 * Theory of Operation: A static, mutex-guarded sink. Lines look like
 *   "[component] message" with "warning: " / "error: " inserted for those levels.
 *   The signal thread and the main thread both log, hence the lock.
 */
#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace floability {
namespace support {

enum class LogLevel { Debug, Info, Warning, Error };

/*** Log: Emit one line if level passes the current threshold. */
void Log(LogLevel level, std::string_view component, std::string_view message);

/*** SetLogLevel: Change the minimum level that is emitted (default Info). */
void SetLogLevel(LogLevel level);

/*** SetLogStream: Redirect console output (nullptr restores std::cerr). */
void SetLogStream(std::ostream* out);

/*** MirrorLogToFile: Also append every emitted line to path; empty path stops mirroring. */
bool MirrorLogToFile(const std::string& path, std::string& err);

/*** UseEnvVerbose: True when FLOABILITY_VERBOSE is 1/true/yes (case-insensitive). */
bool UseEnvVerbose();

}  // namespace support
}  // namespace floability
