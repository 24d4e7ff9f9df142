/***
 * Name: floability::archive::detail::Bzip2Source
 * Purpose: Decompress a bzip2 stream pulled from an inner ByteSource.
 * Inputs: inner source positioned at "BZh"
 * Outputs: Decompressed bytes
 * Theory of Operation: BZ2_bzDecompress in a refill loop; a finished stream followed
 *   by more input is re-initialized to support concatenated streams.
 */
#include "floability/archive/detail/sources.h"

#include <string>
#include <utility>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive::detail {

Bzip2Source::Bzip2Source(std::unique_ptr<ByteSource> inner) : inner_(std::move(inner)) {
  if (BZ2_bzDecompressInit(&stream_, 0, 0) != BZ_OK) {
    throw exceptions::ExtractionError("failed to initialize bzip2 decoder");
  }
  initialized_ = true;
}

Bzip2Source::~Bzip2Source() {
  if (initialized_) {
    BZ2_bzDecompressEnd(&stream_);
  }
}

auto Bzip2Source::Refill() -> bool {
  if (inner_eof_) {
    return false;
  }
  const std::size_t got = inner_->Read(input_.data(), input_.size());
  if (got == 0) {
    inner_eof_ = true;
    return false;
  }
  stream_.next_in = reinterpret_cast<char*>(input_.data());
  stream_.avail_in = static_cast<unsigned int>(got);
  return true;
}

auto Bzip2Source::Read(std::uint8_t* dst, std::size_t len) -> std::size_t {
  if (finished_ || len == 0) {
    return 0;
  }
  stream_.next_out = reinterpret_cast<char*>(dst);
  stream_.avail_out = static_cast<unsigned int>(len);
  while (stream_.avail_out == len) {
    if (stream_.avail_in == 0 && !Refill()) {
      throw exceptions::ExtractionError("truncated bzip2 stream");
    }
    const int ret = BZ2_bzDecompress(&stream_);
    if (ret == BZ_STREAM_END) {
      if (stream_.avail_in == 0 && !Refill()) {
        finished_ = true;
        break;
      }
      char* pending_in = stream_.next_in;
      const unsigned int pending_len = stream_.avail_in;
      char* pending_out = stream_.next_out;
      const unsigned int out_left = stream_.avail_out;
      BZ2_bzDecompressEnd(&stream_);
      initialized_ = false;
      stream_ = bz_stream{};
      if (BZ2_bzDecompressInit(&stream_, 0, 0) != BZ_OK) {
        throw exceptions::ExtractionError("failed to restart bzip2 decoder");
      }
      initialized_ = true;
      stream_.next_in = pending_in;
      stream_.avail_in = pending_len;
      stream_.next_out = pending_out;
      stream_.avail_out = out_left;
      continue;
    }
    if (ret != BZ_OK) {
      throw exceptions::ExtractionError("corrupt bzip2 data (error " + std::to_string(ret) + ")");
    }
  }
  return len - stream_.avail_out;
}

}  // namespace floability::archive::detail
