#include "floability/support/log.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace floability::support {

static bool EqualsCi(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const auto lhs_ch = static_cast<unsigned char>(lhs[i]);
    const auto rhs_ch = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(lhs_ch) != std::tolower(rhs_ch)) { return false; }
  }
  return true;
}

static bool IsTrueValue(const char* str_val) {
  if (str_val == nullptr) { return false; }
  const std::string_view val_view{str_val, std::strlen(str_val)};
  if (val_view == "1") { return true; }
  if (EqualsCi(val_view, "true")) { return true; }
  if (EqualsCi(val_view, "yes")) { return true; }
  return false;
}

bool UseEnvVerbose() {
  return IsTrueValue(std::getenv("FLOABILITY_VERBOSE"));
}

}  // namespace floability::support
