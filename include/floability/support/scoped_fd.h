/***
 * Name: floability::support::ScopedFd
 * Purpose: Own a POSIX file descriptor and close it on scope exit.
 * Inputs: Descriptor (negative means empty)
 * Outputs: none
 * Theory of Operation: Move-only. Release() hands ownership back to the caller,
 *   which is how paths that must check close(2) take over.
 */
#pragma once

#include <unistd.h>

namespace floability {
namespace support {

class ScopedFd {
 public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() { Reset(); }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ScopedFd(ScopedFd&& other) noexcept : fd_(other.Release()) {}
  ScopedFd& operator=(ScopedFd&& other) noexcept {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }

  int Get() const { return fd_; }
  bool Valid() const { return fd_ >= 0; }
  int Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_{-1};
};

}  // namespace support
}  // namespace floability
