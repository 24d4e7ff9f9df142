/***
 * Name: floability::exceptions::TerminationError
 * Purpose: Soft error for a process that could not be signalled or reaped.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Raised by process handles; CleanupRegistry collects it
 *   into its report and keeps going.
 */
#pragma once

#include "floability/exceptions/floability_exception.h"

namespace floability {
namespace exceptions {

class TerminationError : public FloabilityException {
 public:
  using FloabilityException::FloabilityException;
};

}  // namespace exceptions
}  // namespace floability
