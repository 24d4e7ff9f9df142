/***
 * Name: floability::exceptions::EnvironmentBuildError
 * Purpose: Exception for failures turning an environment description into an archive.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from FloabilityException.
 */
#pragma once

#include "floability/exceptions/floability_exception.h"

namespace floability {
namespace exceptions {

class EnvironmentBuildError : public FloabilityException {
 public:
  using FloabilityException::FloabilityException;
};

}  // namespace exceptions
}  // namespace floability
