/***
 * Name: testutil::TarBuilder
 * Purpose: Build tar archives in memory (optionally compressed) for extraction tests.
 */
#pragma once

#include <cstdint>
#include <string>

namespace testutil {

class TarBuilder {
 public:
  TarBuilder& File(const std::string& name, const std::string& content, std::uint32_t mode = 0644);
  TarBuilder& Directory(const std::string& name, std::uint32_t mode = 0755);
  TarBuilder& Symlink(const std::string& name, const std::string& target);
  TarBuilder& Hardlink(const std::string& name, const std::string& target);
  TarBuilder& Fifo(const std::string& name);
  // Name stored through a pax 'x' record instead of the header field.
  TarBuilder& PaxFile(const std::string& name, const std::string& content);

  // Raw tar stream including the two terminating zero blocks.
  std::string Build() const;

 private:
  void Header(const std::string& name, char type, std::uint64_t size, std::uint32_t mode,
              const std::string& link = std::string());
  void Payload(const std::string& data);

  std::string out_;
};

std::string Gzip(const std::string& data);
std::string Bzip2(const std::string& data);
std::string Xz(const std::string& data);

void WriteBytes(const std::string& path, const std::string& data);
std::string ReadBytes(const std::string& path);

}  // namespace testutil
