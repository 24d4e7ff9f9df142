/***
 * Name: floability::archive (byte_source)
 * Purpose: Pull-based byte streams used to feed the tar reader, with transparent
 *   decompression chosen from the archive's leading magic bytes.
 * Inputs: Archive file path
 * Outputs: A ByteSource yielding the uncompressed tar stream
 * Theory of Operation: Each decoder wraps another ByteSource and is stacked over a
 *   file source. Streaming keeps memory flat for multi-gigabyte environments.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace floability {
namespace archive {

enum class Compression { None, Gzip, Bzip2, Xz };

class ByteSource {
 public:
  virtual ~ByteSource() = default;
  /*** Read: Fill up to len bytes; returns 0 only at end of stream. Throws ExtractionError. */
  virtual std::size_t Read(std::uint8_t* dst, std::size_t len) = 0;
};

/*** DetectCompression: Identify gzip, bzip2, or xz magic; anything else is None. */
Compression DetectCompression(const std::uint8_t* data, std::size_t len);

/*** CompressionName: Human-readable name for logs. */
const char* CompressionName(Compression kind);

/*** OpenArchiveSource: Open path and stack the matching decoder; throws ExtractionError. */
std::unique_ptr<ByteSource> OpenArchiveSource(const std::string& path);

}  // namespace archive
}  // namespace floability
