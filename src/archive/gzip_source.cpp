/***
 * Name: floability::archive::detail::GzipSource
 * Purpose: Inflate a gzip (or zlib) stream pulled from an inner ByteSource.
 * Inputs: inner source positioned at the gzip header
 * Outputs: Decompressed bytes
 * Theory of Operation: inflateInit2 with 15+32 window bits auto-detects gzip/zlib
 *   headers. On Z_STREAM_END with more input pending the stream is reset, so
 *   multi-member files produced by parallel compressors decode completely.
 */
#include "floability/archive/detail/sources.h"

#include <string>
#include <utility>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive::detail {

GzipSource::GzipSource(std::unique_ptr<ByteSource> inner) : inner_(std::move(inner)) {
  constexpr int kAutoDetectWindow = 15 + 32;
  if (inflateInit2(&stream_, kAutoDetectWindow) != Z_OK) {
    throw exceptions::ExtractionError("failed to initialize gzip decoder");
  }
}

GzipSource::~GzipSource() { inflateEnd(&stream_); }

auto GzipSource::Refill() -> bool {
  if (inner_eof_) {
    return false;
  }
  const std::size_t got = inner_->Read(input_.data(), input_.size());
  if (got == 0) {
    inner_eof_ = true;
    return false;
  }
  stream_.next_in = input_.data();
  stream_.avail_in = static_cast<uInt>(got);
  return true;
}

auto GzipSource::Read(std::uint8_t* dst, std::size_t len) -> std::size_t {
  if (finished_ || len == 0) {
    return 0;
  }
  stream_.next_out = dst;
  stream_.avail_out = static_cast<uInt>(len);
  while (stream_.avail_out == len) {
    if (stream_.avail_in == 0 && !Refill()) {
      throw exceptions::ExtractionError("truncated gzip stream");
    }
    const int ret = inflate(&stream_, Z_NO_FLUSH);
    if (ret == Z_STREAM_END) {
      if (stream_.avail_in == 0 && !Refill()) {
        finished_ = true;
        break;
      }
      inflateReset(&stream_);
      continue;
    }
    if (ret != Z_OK && ret != Z_BUF_ERROR) {
      const std::string detail = stream_.msg != nullptr ? stream_.msg : "error " + std::to_string(ret);
      throw exceptions::ExtractionError("corrupt gzip data: " + detail);
    }
  }
  return len - stream_.avail_out;
}

}  // namespace floability::archive::detail
