/***
 * Name: floability::archive::detail (sources)
 * Purpose: Concrete ByteSource implementations: raw file plus zlib, bzip2, and xz decoders.
 * Inputs: File path or an inner ByteSource
 * Outputs: Decoded bytes via Read()
 * Theory of Operation: Decoders keep a fixed input buffer refilled from the inner
 *   source and accept concatenated streams (pigz/pbzip2/pixz output).
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include "floability/archive/byte_source.h"

namespace floability {
namespace archive {
namespace detail {

constexpr std::size_t kInputBufferSize = 64 * 1024;

class FileSource final : public ByteSource {
 public:
  explicit FileSource(const std::string& path);
  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::size_t Read(std::uint8_t* dst, std::size_t len) override;
  /*** Rewind: Seek back to the first byte (used after sniffing magic). */
  void Rewind();

 private:
  std::string path_;
  std::FILE* file_{nullptr};
};

class GzipSource final : public ByteSource {
 public:
  explicit GzipSource(std::unique_ptr<ByteSource> inner);
  ~GzipSource() override;
  GzipSource(const GzipSource&) = delete;
  GzipSource& operator=(const GzipSource&) = delete;

  std::size_t Read(std::uint8_t* dst, std::size_t len) override;

 private:
  bool Refill();

  std::unique_ptr<ByteSource> inner_;
  z_stream stream_{};
  std::array<std::uint8_t, kInputBufferSize> input_{};
  bool inner_eof_{false};
  bool finished_{false};
};

class Bzip2Source final : public ByteSource {
 public:
  explicit Bzip2Source(std::unique_ptr<ByteSource> inner);
  ~Bzip2Source() override;
  Bzip2Source(const Bzip2Source&) = delete;
  Bzip2Source& operator=(const Bzip2Source&) = delete;

  std::size_t Read(std::uint8_t* dst, std::size_t len) override;

 private:
  bool Refill();

  std::unique_ptr<ByteSource> inner_;
  bz_stream stream_{};
  std::array<std::uint8_t, kInputBufferSize> input_{};
  bool inner_eof_{false};
  bool finished_{false};
  bool initialized_{false};
};

class XzSource final : public ByteSource {
 public:
  explicit XzSource(std::unique_ptr<ByteSource> inner);
  ~XzSource() override;
  XzSource(const XzSource&) = delete;
  XzSource& operator=(const XzSource&) = delete;

  std::size_t Read(std::uint8_t* dst, std::size_t len) override;

 private:
  std::unique_ptr<ByteSource> inner_;
  lzma_stream stream_ = LZMA_STREAM_INIT;
  std::array<std::uint8_t, kInputBufferSize> input_{};
  bool inner_eof_{false};
  bool finished_{false};
};

}  // namespace detail
}  // namespace archive
}  // namespace floability
