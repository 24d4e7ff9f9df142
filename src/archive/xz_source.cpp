/***
 * Name: floability::archive::detail::XzSource
 * Purpose: Decompress an xz stream pulled from an inner ByteSource.
 * Inputs: inner source positioned at the xz magic
 * Outputs: Decompressed bytes
 * Theory of Operation: liblzma stream decoder with LZMA_CONCATENATED; LZMA_FINISH is
 *   passed once the inner source is exhausted so truncation is reported.
 */
#include "floability/archive/detail/sources.h"

#include <cstdint>
#include <string>
#include <utility>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive::detail {

XzSource::XzSource(std::unique_ptr<ByteSource> inner) : inner_(std::move(inner)) {
  if (lzma_stream_decoder(&stream_, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) {
    throw exceptions::ExtractionError("failed to initialize xz decoder");
  }
}

XzSource::~XzSource() { lzma_end(&stream_); }

auto XzSource::Read(std::uint8_t* dst, std::size_t len) -> std::size_t {
  if (finished_ || len == 0) {
    return 0;
  }
  stream_.next_out = dst;
  stream_.avail_out = len;
  while (stream_.avail_out == len) {
    if (stream_.avail_in == 0 && !inner_eof_) {
      const std::size_t got = inner_->Read(input_.data(), input_.size());
      if (got == 0) {
        inner_eof_ = true;
      }
      stream_.next_in = input_.data();
      stream_.avail_in = got;
    }
    const lzma_ret ret = lzma_code(&stream_, inner_eof_ ? LZMA_FINISH : LZMA_RUN);
    if (ret == LZMA_STREAM_END) {
      finished_ = true;
      break;
    }
    if (ret == LZMA_BUF_ERROR && inner_eof_) {
      throw exceptions::ExtractionError("truncated xz stream");
    }
    if (ret != LZMA_OK) {
      throw exceptions::ExtractionError("corrupt xz data (error " + std::to_string(static_cast<int>(ret)) + ")");
    }
  }
  return len - stream_.avail_out;
}

}  // namespace floability::archive::detail
