/***
 * Name: floability::exceptions::AllocationError
 * Purpose: Exception for run directory allocation failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from FloabilityException.
 */
#pragma once

#include "floability/exceptions/floability_exception.h"

namespace floability {
namespace exceptions {

class AllocationError : public FloabilityException {
 public:
  using FloabilityException::FloabilityException;
};

}  // namespace exceptions
}  // namespace floability
