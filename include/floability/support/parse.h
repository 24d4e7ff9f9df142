/***
 * Name: floability::support (parse)
 * Purpose: Parse numeric command-line values together with their permitted range.
 * Inputs: Option value text, bounds
 * Outputs: Parsed value via out parameter; returns true on success
 * Theory of Operation: Plain decimal digits only. No sign, no whitespace, no
 *   radix prefix, so "-1", " 8" and "0x10" are all rejected with a reason that
 *   names the accepted range. Nothing here throws.
 */
#pragma once

#include <chrono>
#include <limits>
#include <string>
#include <string_view>

namespace floability {
namespace support {

struct IntBounds {
  int min{0};
  int max{std::numeric_limits<int>::max()};
};

/*** ParseBoundedInt: Decimal value within [bounds.min, bounds.max]. */
bool ParseBoundedInt(std::string_view text, IntBounds bounds, int& out, std::string* err = nullptr);

/*** ParseDuration: "<n>" or "<n>s" for seconds, "<n>ms" for milliseconds; at least min. */
bool ParseDuration(std::string_view text, std::chrono::milliseconds min, std::chrono::milliseconds& out,
                   std::string* err = nullptr);

}  // namespace support
}  // namespace floability
