/***
 * Name: floability::archive::detail::ParseNumericField
 * Purpose: Decode a numeric tar header field.
 * Inputs: field bytes and width
 * Outputs: Unsigned value
 * Theory of Operation: Leading 0x80 marks GNU base-256 (big-endian, used for sizes
 *   over 8 GiB); otherwise octal digits after optional spaces until NUL or space.
 */
#include "floability/archive/tar_reader.h"

#include <cstddef>
#include <cstdint>
#include <string>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive::detail {

auto ParseNumericField(const std::uint8_t* field, std::size_t size) -> std::uint64_t {
  std::uint64_t value = 0;
  if (size > 0 && (field[0] & 0x80U) != 0) {
    value = field[0] & 0x7FU;
    for (std::size_t i = 1; i < size; ++i) {
      if ((value >> 56) != 0) {
        throw exceptions::ExtractionError("tar numeric field overflow");
      }
      value = (value << 8) | field[i];
    }
    return value;
  }
  std::size_t i = 0;
  while (i < size && field[i] == ' ') {
    ++i;
  }
  for (; i < size && field[i] != '\0' && field[i] != ' '; ++i) {
    if (field[i] < '0' || field[i] > '7') {
      throw exceptions::ExtractionError("invalid octal digit in tar header");
    }
    value = (value << 3) | static_cast<std::uint64_t>(field[i] - '0');
  }
  return value;
}

}  // namespace floability::archive::detail
