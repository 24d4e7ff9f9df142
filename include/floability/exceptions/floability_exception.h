/***
 * Name: floability::exceptions::FloabilityException
 * Purpose: Base class for all floability exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in floability must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace floability {
namespace exceptions {

class FloabilityException : public std::exception {
 public:
  virtual ~FloabilityException() noexcept = default;
  explicit FloabilityException(std::string msg) noexcept;
  const char* what() const noexcept override;

 protected:
  std::string message_;
};

}  // namespace exceptions
}  // namespace floability
