/***
 * Name: floability::support::ParseDuration
 * Purpose: Parse --poll-interval and --grace-period values.
 * Inputs:
 *   - text: "<n>", "<n>s" or "<n>ms"
 *   - min: smallest accepted duration
 * Outputs:
 *   - out: duration in milliseconds
 *   - err: reason on failure
 * Theory of Operation: Strip the unit suffix, then parse the count with
 *   ParseBoundedInt capped so the millisecond value still fits in an int.
 */
#include "floability/support/parse.h"

#include <chrono>
#include <limits>
#include <string>
#include <string_view>

namespace floability::support {

auto ParseDuration(std::string_view text, std::chrono::milliseconds min, std::chrono::milliseconds& out,
                   std::string* err) -> bool {
  constexpr int kMsPerSecond = 1000;
  int scale = kMsPerSecond;
  if (text.ends_with("ms")) {
    text.remove_suffix(2);
    scale = 1;
  } else if (text.ends_with("s")) {
    text.remove_suffix(1);
  }
  int count = 0;
  std::string why;
  if (!ParseBoundedInt(text, IntBounds{0, std::numeric_limits<int>::max() / scale}, count, &why)) {
    if (err != nullptr) {
      *err = "expected <seconds>, <n>s or <n>ms: " + why;
    }
    return false;
  }
  const std::chrono::milliseconds value(static_cast<long long>(count) * scale);
  if (value < min) {
    if (err != nullptr) {
      *err = "must be at least " + std::to_string(min.count()) + "ms";
    }
    return false;
  }
  out = value;
  return true;
}

}  // namespace floability::support
