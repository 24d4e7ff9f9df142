/***
 * Name: floability::exceptions::FloabilityException::FloabilityException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "floability/exceptions/floability_exception.h"

#include <utility>

namespace floability {
namespace exceptions {

FloabilityException::FloabilityException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace floability
