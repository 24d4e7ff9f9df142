/***
 * Name: floability::support::GenerateManagerIdentity
 * Purpose: Build a session-unique manager name when the user did not supply one.
 * Inputs: none
 * Outputs: "floability-<uuid4>"
 */
#include "floability/support/identity.h"

#include <string>

namespace floability::support {

auto GenerateManagerIdentity() -> std::string {
  return "floability-" + GenerateUuid4();
}

}  // namespace floability::support
