/***
 * Name: floability::archive::OpenArchiveSource
 * Purpose: Open an archive file and return a stream of its uncompressed tar bytes.
 * Inputs:
 *   - path: archive on disk
 * Outputs:
 *   - ByteSource owning the file and decoder
 * Theory of Operation: Sniff six bytes, rewind, then stack the decoder picked by
 *   DetectCompression. A zero-length file is rejected here with a clear message.
 */
#include "floability/archive/byte_source.h"
#include "floability/archive/detail/sources.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "floability/exceptions/extraction_error.h"
#include "floability/support/log.h"

namespace floability::archive {

auto OpenArchiveSource(const std::string& path) -> std::unique_ptr<ByteSource> {
  auto file = std::make_unique<detail::FileSource>(path);
  std::array<std::uint8_t, 6> magic{};
  std::size_t got = 0;
  while (got < magic.size()) {
    const std::size_t n = file->Read(magic.data() + got, magic.size() - got);
    if (n == 0) {
      break;
    }
    got += n;
  }
  if (got == 0) {
    throw exceptions::ExtractionError("archive is empty: " + path);
  }
  file->Rewind();

  const Compression kind = DetectCompression(magic.data(), got);
  support::Log(support::LogLevel::Debug, "extract", std::string("detected ") + CompressionName(kind) + " archive");
  switch (kind) {
    case Compression::Gzip: return std::make_unique<detail::GzipSource>(std::move(file));
    case Compression::Bzip2: return std::make_unique<detail::Bzip2Source>(std::move(file));
    case Compression::Xz: return std::make_unique<detail::XzSource>(std::move(file));
    case Compression::None: break;
  }
  return file;
}

}  // namespace floability::archive
