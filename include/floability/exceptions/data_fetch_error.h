/***
 * Name: floability::exceptions::DataFetchError
 * Purpose: Exception for failures fetching declared input data.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from FloabilityException.
 */
#pragma once

#include "floability/exceptions/floability_exception.h"

namespace floability {
namespace exceptions {

class DataFetchError : public FloabilityException {
 public:
  using FloabilityException::FloabilityException;
};

}  // namespace exceptions
}  // namespace floability
