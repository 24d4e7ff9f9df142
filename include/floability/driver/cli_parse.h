/***
 * Name: floability::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose CLI option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple.
 */
#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "floability/driver/cli.h"

namespace floability {
namespace driver {
namespace detail {

/*** ValueOption: One "--name <value>" option and the function that applies it. */
struct ValueOption {
  std::string_view name;
  bool (*apply)(const std::string& value, RunOptions& dst, std::ostream& err);
};

/*** ValueOptions: The table of all value-taking options. */
const std::vector<ValueOption>& ValueOptions();

/*** HandleHelpArg: Recognize -h/--help and set flag. */
OptResult HandleHelpArg(const std::string& arg, RunOptions& dst);

/*** HandleMetricsArg: Parse --metrics and --metrics=.. variants. */
OptResult HandleMetricsArg(const std::string& arg, RunOptions& dst, std::ostream& err);

/*** HandleSwitch: Handle boolean switches (-v/--verbose). */
OptResult HandleSwitch(const std::string& arg, RunOptions& dst);

/*** HandleValueArg: Handle "--name value" and "--name=value" for table options. */
OptResult HandleValueArg(const std::vector<std::string>& args, int& index, int argc, RunOptions& dst,
                         std::ostream& err);

/*** HandleUnknownOrPositional: Error on unknown '-' options and stray positionals. */
OptResult HandleUnknownOrPositional(const std::string& arg, std::ostream& err);

/*** ParseCommand: Map "run" / "fetch" to a Command. */
bool ParseCommand(const std::string& word, RunOptions::Command& out);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args, int& index, int argc, RunOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace floability
