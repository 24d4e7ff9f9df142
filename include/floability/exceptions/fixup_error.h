/***
 * Name: floability::exceptions::FixupError
 * Purpose: Exception for a failed post-extraction path fixup command.
 * Inputs: Error message, exit code, captured diagnostic output
 * Outputs: Exception object carrying the child's output for display
 * Theory of Operation: The fixup tool's output is the only useful diagnostic,
 *   so it travels with the exception instead of being dropped.
 */
#pragma once

#include <string>
#include <utility>

#include "floability/exceptions/floability_exception.h"

namespace floability {
namespace exceptions {

class FixupError : public FloabilityException {
 public:
  FixupError(std::string msg, int exit_code, std::string output) noexcept
      : FloabilityException(std::move(msg)), exit_code_(exit_code), output_(std::move(output)) {}

  int exit_code() const noexcept { return exit_code_; }
  const std::string& output() const noexcept { return output_; }

 private:
  int exit_code_;
  std::string output_;
};

}  // namespace exceptions
}  // namespace floability
