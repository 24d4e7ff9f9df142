/***
 * Name: floability::support::GenerateUuid4
 * Purpose: Produce a random RFC 4122 version-4 UUID string.
 * Inputs: none
 * Outputs: 36-character lowercase UUID
 * Theory of Operation: 128 random bits from a random_device-seeded 64-bit engine,
 *   with the version nibble set to 4 and the variant bits to 10xx.
 */
#include "floability/support/identity.h"

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace floability::support {

auto GenerateUuid4() -> std::string {
  thread_local std::mt19937_64 engine{[] {
    std::random_device device;
    std::seed_seq seq{device(), device(), device(), device()};
    return std::mt19937_64(seq);
  }()};

  std::array<std::uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    std::uint64_t word = engine();
    for (std::size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<std::uint8_t>(word >> (j * 8));
    }
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);

  constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out += '-';
    }
    out += kHex[bytes[i] >> 4];
    out += kHex[bytes[i] & 0x0FU];
  }
  return out;
}

}  // namespace floability::support
