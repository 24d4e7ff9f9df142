/***
 * Name: floability::exceptions::PathTraversalError
 * Purpose: Exception for archive members that would resolve outside the extraction root.
 * Inputs: Error message naming the offending member
 * Outputs: Exception object
 * Theory of Operation: Deliberately not derived from ExtractionError so an I/O
 *   catch site cannot swallow it; a traversal attempt is always fatal.
 */
#pragma once

#include "floability/exceptions/floability_exception.h"

namespace floability {
namespace exceptions {

class PathTraversalError : public FloabilityException {
 public:
  using FloabilityException::FloabilityException;
};

}  // namespace exceptions
}  // namespace floability
