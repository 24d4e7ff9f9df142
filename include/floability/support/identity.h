/***
 * Name: floability::support (identity)
 * Purpose: Generate the manager identity that the provisioner and the session rendezvous on.
 * Inputs: none
 * Outputs: Identity strings
 * Theory of Operation: RFC 4122 version-4 UUIDs from std::random_device seeded engines.
 */
#pragma once

#include <string>

namespace floability {
namespace support {

/*** GenerateUuid4: Random UUID in canonical 8-4-4-4-12 lowercase hex form. */
std::string GenerateUuid4();

/*** GenerateManagerIdentity: "floability-" followed by a fresh UUID. */
std::string GenerateManagerIdentity();

}  // namespace support
}  // namespace floability
