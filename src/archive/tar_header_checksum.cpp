/***
 * Name: floability::archive::detail::HeaderChecksumMatches
 * Purpose: Validate a 512-byte tar header against its stored checksum.
 * Inputs: block (512 bytes)
 * Outputs: true when either the unsigned or the historic signed sum matches
 * Theory of Operation: The checksum field (offset 148, 8 bytes) counts as spaces.
 */
#include "floability/archive/tar_reader.h"

#include <cstddef>
#include <cstdint>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive::detail {

auto HeaderChecksumMatches(const std::uint8_t* block) -> bool {
  constexpr std::size_t kChecksumOffset = 148;
  constexpr std::size_t kChecksumSize = 8;
  std::uint64_t unsigned_sum = 0;
  std::int64_t signed_sum = 0;
  for (std::size_t i = 0; i < kTarBlockSize; ++i) {
    const bool in_field = i >= kChecksumOffset && i < kChecksumOffset + kChecksumSize;
    const std::uint8_t byte = in_field ? static_cast<std::uint8_t>(' ') : block[i];
    unsigned_sum += byte;
    signed_sum += static_cast<std::int8_t>(byte);
  }
  std::uint64_t stored = 0;
  try {
    stored = ParseNumericField(block + kChecksumOffset, kChecksumSize);
  } catch (const exceptions::ExtractionError&) {
    return false;
  }
  return stored == unsigned_sum || static_cast<std::int64_t>(stored) == signed_sum;
}

}  // namespace floability::archive::detail
