/***
 * Name: floability::support::ParseBoundedInt
 * Purpose: Parse a worker count, core count or port and check it against its range.
 * Inputs:
 *   - text: option value
 *   - bounds: inclusive range
 * Outputs:
 *   - out: parsed value, written only on success
 *   - err: reason on failure
 * Theory of Operation: Accumulate in long long and stop as soon as the value
 *   passes bounds.max, so arbitrarily long digit strings cannot overflow.
 */
#include "floability/support/parse.h"

#include <limits>
#include <string>
#include <string_view>
#include <utility>

namespace floability::support {

static bool Fail(std::string* err, std::string why) {
  if (err != nullptr) {
    *err = std::move(why);
  }
  return false;
}

static std::string RangeText(IntBounds bounds) {
  if (bounds.max == std::numeric_limits<int>::max()) {
    return "must be at least " + std::to_string(bounds.min);
  }
  return "must be between " + std::to_string(bounds.min) + " and " + std::to_string(bounds.max);
}

auto ParseBoundedInt(std::string_view text, IntBounds bounds, int& out, std::string* err) -> bool {
  if (text.empty()) {
    return Fail(err, "expected a number");
  }
  long long value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return Fail(err, "expected a plain decimal number, " + RangeText(bounds));
    }
    value = value * 10 + (c - '0');
    if (value > bounds.max) {
      return Fail(err, RangeText(bounds));
    }
  }
  if (value < bounds.min) {
    return Fail(err, RangeText(bounds));
  }
  out = static_cast<int>(value);
  return true;
}

}  // namespace floability::support
