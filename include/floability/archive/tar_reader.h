/***
 * Name: floability::archive::TarReader
 * Purpose: Sequentially decode tar headers and payloads from a ByteSource.
 * Inputs: Uncompressed tar byte stream
 * Outputs: One TarMember at a time, with its payload streamed on request
 * Theory of Operation: Reads 512-byte blocks; understands ustar prefix/name,
 *   GNU long name/link records ('L'/'K'), and pax extended headers ('x', 'g').
 *   Header checksums are verified so random data is rejected instead of being
 *   interpreted as members. Unread payload is skipped by the next Next() call.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "floability/archive/byte_source.h"

namespace floability {
namespace archive {

enum class MemberType { Regular, Directory, Symlink, Hardlink, Other };

struct TarMember {
  std::string name;
  std::string link_target;
  MemberType type{MemberType::Regular};
  char typeflag{'0'};
  std::uint64_t size{0};
  std::uint32_t mode{0};
  std::int64_t mtime{0};
};

class TarReader {
 public:
  using PayloadSink = std::function<void(const std::uint8_t* data, std::size_t len)>;

  explicit TarReader(ByteSource& source) : source_(source) {}

  /*** Next: Advance to the next member; false at end of archive. Throws ExtractionError. */
  bool Next(TarMember& out);

  /*** ReadPayload: Stream the current member's data into sink in chunks. */
  void ReadPayload(const PayloadSink& sink);

  std::uint64_t members_read() const { return members_; }

 private:
  bool ReadBlock(std::uint8_t* block);
  void ReadExact(std::uint8_t* dst, std::size_t len);
  void SkipPayload();
  std::string ReadTextPayload(std::uint64_t size);

  ByteSource& source_;
  std::uint64_t remaining_{0};
  std::uint64_t padding_{0};
  std::uint64_t members_{0};
  bool saw_header_{false};
};

namespace detail {

constexpr std::size_t kTarBlockSize = 512;

/*** ParseNumericField: Octal (NUL/space terminated) or GNU base-256 field value. */
std::uint64_t ParseNumericField(const std::uint8_t* field, std::size_t size);

/*** HeaderChecksumMatches: Verify the stored checksum (unsigned or historic signed sum). */
bool HeaderChecksumMatches(const std::uint8_t* block);

/*** ApplyPaxRecords: Parse "len key=value\n" records, capturing path, linkpath, and size. */
void ApplyPaxRecords(const std::string& records, std::string& path, std::string& linkpath, std::uint64_t& size,
                     bool& has_size);

}  // namespace detail

}  // namespace archive
}  // namespace floability
