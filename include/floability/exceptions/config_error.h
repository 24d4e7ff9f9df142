/***
 * Name: floability::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from FloabilityException.
 */
#pragma once

#include "floability/exceptions/floability_exception.h"

namespace floability {
namespace exceptions {

class ConfigError : public FloabilityException {
 public:
  using FloabilityException::FloabilityException;
};

}  // namespace exceptions
}  // namespace floability
