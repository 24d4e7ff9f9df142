/***
 * Name: floability::archive::TarReader
 * Purpose: Decode tar members from an uncompressed stream.
 * Inputs: ByteSource
 * Outputs: TarMember headers and streamed payloads
 * Theory of Operation: Metadata records ('L', 'K', 'x', 'g') are folded into the
 *   following real header. A zero block ends the archive; a stream that ends
 *   mid-block, or before any header at all, is reported as corrupt.
 */
#include "floability/archive/tar_reader.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive {

namespace {

constexpr std::size_t kNameOffset = 0;
constexpr std::size_t kNameSize = 100;
constexpr std::size_t kModeOffset = 100;
constexpr std::size_t kModeSize = 8;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kSizeSize = 12;
constexpr std::size_t kMtimeOffset = 136;
constexpr std::size_t kMtimeSize = 12;
constexpr std::size_t kTypeOffset = 156;
constexpr std::size_t kLinkOffset = 157;
constexpr std::size_t kLinkSize = 100;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kPrefixOffset = 345;
constexpr std::size_t kPrefixSize = 155;
constexpr std::uint64_t kMaxMetadataSize = 1U << 20;

std::string FieldString(const std::uint8_t* block, std::size_t offset, std::size_t size) {
  const auto* begin = reinterpret_cast<const char*>(block + offset);
  return std::string(begin, strnlen(begin, size));
}

MemberType ClassifyTypeflag(char typeflag) {
  switch (typeflag) {
    case '0':
    case '\0':
    case '7':
      return MemberType::Regular;
    case '5':
    case 'D':
      return MemberType::Directory;
    case '2':
      return MemberType::Symlink;
    case '1':
      return MemberType::Hardlink;
    default:
      return MemberType::Other;
  }
}

}  // namespace

auto TarReader::ReadExact(std::uint8_t* dst, std::size_t len) -> void {
  std::size_t got = 0;
  while (got < len) {
    const std::size_t n = source_.Read(dst + got, len - got);
    if (n == 0) {
      throw exceptions::ExtractionError("unexpected end of tar stream");
    }
    got += n;
  }
}

auto TarReader::ReadBlock(std::uint8_t* block) -> bool {
  std::size_t got = 0;
  while (got < detail::kTarBlockSize) {
    const std::size_t n = source_.Read(block + got, detail::kTarBlockSize - got);
    if (n == 0) {
      break;
    }
    got += n;
  }
  if (got == 0) {
    return false;
  }
  if (got < detail::kTarBlockSize) {
    throw exceptions::ExtractionError("truncated tar header");
  }
  return true;
}

auto TarReader::SkipPayload() -> void {
  std::array<std::uint8_t, 8192> scratch{};
  std::uint64_t left = remaining_ + padding_;
  while (left > 0) {
    const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(left, scratch.size()));
    ReadExact(scratch.data(), chunk);
    left -= chunk;
  }
  remaining_ = 0;
  padding_ = 0;
}

auto TarReader::ReadTextPayload(std::uint64_t size) -> std::string {
  if (size > kMaxMetadataSize) {
    throw exceptions::ExtractionError("tar metadata record too large");
  }
  remaining_ = size;
  padding_ = (detail::kTarBlockSize - size % detail::kTarBlockSize) % detail::kTarBlockSize;
  std::string text;
  text.reserve(static_cast<std::size_t>(size));
  ReadPayload([&text](const std::uint8_t* data, std::size_t len) {
    text.append(reinterpret_cast<const char*>(data), len);
  });
  const std::size_t nul = text.find('\0');
  if (nul != std::string::npos) {
    text.resize(nul);
  }
  return text;
}

auto TarReader::ReadPayload(const PayloadSink& sink) -> void {
  std::array<std::uint8_t, 64 * 1024> buffer{};
  while (remaining_ > 0) {
    const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, buffer.size()));
    ReadExact(buffer.data(), chunk);
    remaining_ -= chunk;
    sink(buffer.data(), chunk);
  }
  SkipPayload();
}

auto TarReader::Next(TarMember& out) -> bool {
  SkipPayload();

  std::string long_name;
  std::string long_link;
  std::string pax_path;
  std::string pax_link;
  std::uint64_t pax_size = 0;
  bool has_pax_size = false;

  std::array<std::uint8_t, detail::kTarBlockSize> block{};
  for (;;) {
    if (!ReadBlock(block.data())) {
      if (!saw_header_) {
        throw exceptions::ExtractionError("not a tar archive: no header found");
      }
      return false;  // EOF without the end-of-archive marker; tolerated like GNU tar
    }
    if (std::all_of(block.begin(), block.end(), [](std::uint8_t b) { return b == 0; })) {
      if (!saw_header_) {
        saw_header_ = true;  // an empty archive is still an archive
      }
      return false;
    }
    if (!detail::HeaderChecksumMatches(block.data())) {
      throw exceptions::ExtractionError(saw_header_ ? "invalid tar header checksum"
                                                    : "not a tar archive: invalid header checksum");
    }
    saw_header_ = true;

    const char typeflag = static_cast<char>(block[kTypeOffset]);
    const std::uint64_t size = detail::ParseNumericField(block.data() + kSizeOffset, kSizeSize);
    if (typeflag == 'L') {
      long_name = ReadTextPayload(size);
      continue;
    }
    if (typeflag == 'K') {
      long_link = ReadTextPayload(size);
      continue;
    }
    if (typeflag == 'x') {
      detail::ApplyPaxRecords(ReadTextPayload(size), pax_path, pax_link, pax_size, has_pax_size);
      continue;
    }
    if (typeflag == 'g') {
      remaining_ = size;
      padding_ = (detail::kTarBlockSize - size % detail::kTarBlockSize) % detail::kTarBlockSize;
      SkipPayload();
      continue;
    }

    TarMember member;
    member.typeflag = typeflag;
    member.type = ClassifyTypeflag(typeflag);
    member.mode = static_cast<std::uint32_t>(detail::ParseNumericField(block.data() + kModeOffset, kModeSize));
    member.mtime = static_cast<std::int64_t>(detail::ParseNumericField(block.data() + kMtimeOffset, kMtimeSize));
    member.size = has_pax_size ? pax_size : size;

    if (!long_name.empty()) {
      member.name = long_name;
    } else if (!pax_path.empty()) {
      member.name = pax_path;
    } else {
      member.name = FieldString(block.data(), kNameOffset, kNameSize);
      const bool is_ustar = std::memcmp(block.data() + kMagicOffset, "ustar", 5) == 0;
      const std::string prefix = is_ustar ? FieldString(block.data(), kPrefixOffset, kPrefixSize) : std::string();
      if (!prefix.empty()) {
        member.name = prefix + "/" + member.name;
      }
    }
    if (!long_link.empty()) {
      member.link_target = long_link;
    } else if (!pax_link.empty()) {
      member.link_target = pax_link;
    } else {
      member.link_target = FieldString(block.data(), kLinkOffset, kLinkSize);
    }

    // Link and directory entries carry no payload even if a size is recorded.
    const bool has_payload = member.type == MemberType::Regular || member.type == MemberType::Other;
    remaining_ = has_payload ? member.size : 0;
    const std::uint64_t stored = has_payload ? member.size : 0;
    padding_ = (detail::kTarBlockSize - stored % detail::kTarBlockSize) % detail::kTarBlockSize;
    ++members_;
    out = member;
    return true;
  }
}

}  // namespace floability::archive
