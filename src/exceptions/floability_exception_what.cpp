/***
 * Name: floability::exceptions::FloabilityException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "floability/exceptions/floability_exception.h"

namespace floability::exceptions {

const char* FloabilityException::what() const noexcept { return message_.c_str(); }

}  // namespace floability::exceptions
