/***
 * Name: floability::exceptions::ExtractionError
 * Purpose: Exception for archive read, decode, or write failures during extraction.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from FloabilityException.
 */
#pragma once

#include "floability/exceptions/floability_exception.h"

namespace floability {
namespace exceptions {

class ExtractionError : public FloabilityException {
 public:
  using FloabilityException::FloabilityException;
};

}  // namespace exceptions
}  // namespace floability
