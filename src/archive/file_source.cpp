/***
 * Name: floability::archive::detail::FileSource
 * Purpose: ByteSource over a file on disk.
 * Inputs: path
 * Outputs: Raw file bytes
 * Theory of Operation: stdio FILE* in binary mode; read errors surface as ExtractionError.
 */
#include "floability/archive/detail/sources.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive::detail {

FileSource::FileSource(const std::string& path) : path_(path), file_(std::fopen(path.c_str(), "rb")) {
  if (file_ == nullptr) {
    throw exceptions::ExtractionError("failed to open archive " + path + ": " + std::strerror(errno));
  }
}

FileSource::~FileSource() {
  if (file_ != nullptr) {
    std::fclose(file_);
  }
}

auto FileSource::Read(std::uint8_t* dst, std::size_t len) -> std::size_t {
  const std::size_t got = std::fread(dst, 1, len, file_);
  if (got < len && std::ferror(file_) != 0) {
    throw exceptions::ExtractionError("failed to read archive " + path_ + ": " + std::strerror(errno));
  }
  return got;
}

auto FileSource::Rewind() -> void {
  if (std::fseek(file_, 0, SEEK_SET) != 0) {
    throw exceptions::ExtractionError("failed to rewind archive " + path_ + ": " + std::strerror(errno));
  }
  std::clearerr(file_);
}

}  // namespace floability::archive::detail
