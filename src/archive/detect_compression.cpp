/***
 * Name: floability::archive::DetectCompression
 * Purpose: Identify the compression wrapper from leading bytes, never from the file name.
 * Inputs: data, len (at least 6 bytes recommended)
 * Outputs: Compression kind; None when no magic matches (plain tar or garbage)
 */
#include "floability/archive/byte_source.h"

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace floability::archive {

auto DetectCompression(const std::uint8_t* data, std::size_t len) -> Compression {
  constexpr std::uint8_t kGzip[] = {0x1F, 0x8B};
  constexpr std::uint8_t kBzip2[] = {'B', 'Z', 'h'};
  constexpr std::uint8_t kXz[] = {0xFD, '7', 'z', 'X', 'Z', 0x00};
  if (len >= sizeof(kGzip) && std::memcmp(data, kGzip, sizeof(kGzip)) == 0) {
    return Compression::Gzip;
  }
  if (len >= sizeof(kBzip2) && std::memcmp(data, kBzip2, sizeof(kBzip2)) == 0) {
    return Compression::Bzip2;
  }
  if (len >= sizeof(kXz) && std::memcmp(data, kXz, sizeof(kXz)) == 0) {
    return Compression::Xz;
  }
  return Compression::None;
}

auto CompressionName(Compression kind) -> const char* {
  switch (kind) {
    case Compression::None: return "tar";
    case Compression::Gzip: return "gzip";
    case Compression::Bzip2: return "bzip2";
    case Compression::Xz: return "xz";
  }
  return "unknown";
}

}  // namespace floability::archive
