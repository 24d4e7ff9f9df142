/***
 * Name: test_tar_reader
 * Purpose: Validate tar header decoding: ustar fields, GNU long names, pax paths, and bad input.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>
#include "floability/archive/byte_source.h"
#include "floability/archive/tar_reader.h"
#include "floability/exceptions/extraction_error.h"
#include "util/TarBuilder.h"

using namespace floability::archive;

namespace {

class StringSource final : public ByteSource {
 public:
  explicit StringSource(std::string data) : data_(std::move(data)) {}
  std::size_t Read(std::uint8_t* dst, std::size_t len) override {
    const std::size_t n = std::min(len, data_.size() - pos_);
    std::memcpy(dst, data_.data() + pos_, n);
    pos_ += n;
    return n;
  }

 private:
  std::string data_;
  std::size_t pos_{0};
};

std::vector<TarMember> ReadAll(const std::string& tar) {
  StringSource src(tar);
  TarReader reader(src);
  std::vector<TarMember> out;
  TarMember m;
  while (reader.Next(m)) out.push_back(m);
  return out;
}

}  // namespace

TEST(TarReader, DecodesMemberTypesAndSizes) {
  const auto tar = testutil::TarBuilder()
                       .Directory("bin/")
                       .File("bin/tool", "#!/bin/sh\n", 0755)
                       .Symlink("bin/alias", "tool")
                       .Hardlink("bin/copy", "bin/tool")
                       .Fifo("bin/pipe")
                       .Build();
  const auto members = ReadAll(tar);
  ASSERT_EQ(members.size(), 5u);
  EXPECT_EQ(members[0].type, MemberType::Directory);
  EXPECT_EQ(members[1].name, "bin/tool");
  EXPECT_EQ(members[1].size, 10u);
  EXPECT_EQ(members[1].mode & 0777u, 0755u);
  EXPECT_EQ(members[2].type, MemberType::Symlink);
  EXPECT_EQ(members[2].link_target, "tool");
  EXPECT_EQ(members[3].type, MemberType::Hardlink);
  EXPECT_EQ(members[4].type, MemberType::Other);
  EXPECT_EQ(members[4].typeflag, '6');
}

TEST(TarReader, StreamsPayloadAndSkipsUnread) {
  const std::string big(3000, 'x');
  const auto tar = testutil::TarBuilder().File("a", big).File("b", "second").Build();
  StringSource src(tar);
  TarReader reader(src);
  TarMember m;
  ASSERT_TRUE(reader.Next(m));
  // payload of "a" left unread on purpose
  ASSERT_TRUE(reader.Next(m));
  EXPECT_EQ(m.name, "b");
  std::string payload;
  reader.ReadPayload([&](const std::uint8_t* data, std::size_t len) {
    payload.append(reinterpret_cast<const char*>(data), len);
  });
  EXPECT_EQ(payload, "second");
  EXPECT_FALSE(reader.Next(m));
  EXPECT_EQ(reader.members_read(), 2u);
}

TEST(TarReader, GnuLongName) {
  const std::string long_name = std::string(150, 'd') + "/file.txt";
  const auto members = ReadAll(testutil::TarBuilder().File(long_name, "x").Build());
  ASSERT_EQ(members.size(), 1u);
  EXPECT_EQ(members[0].name, long_name);
}

TEST(TarReader, PaxPathOverridesHeaderName) {
  const auto members = ReadAll(testutil::TarBuilder().PaxFile("pkgs/named-by-pax.txt", "x").Build());
  ASSERT_EQ(members.size(), 1u);
  EXPECT_EQ(members[0].name, "pkgs/named-by-pax.txt");
}

TEST(TarReader, PaxRecordsApplied) {
  std::string path, linkpath;
  std::uint64_t size = 0;
  bool has_size = false;
  detail::ApplyPaxRecords("16 path=a/b.txt\n21 linkpath=../t.txt\n16 size=1234567\n", path, linkpath, size,
                          has_size);
  EXPECT_EQ(path, "a/b.txt");
  EXPECT_EQ(linkpath, "../t.txt");
  EXPECT_TRUE(has_size);
  EXPECT_EQ(size, 1234567u);
}

TEST(TarReader, PaxOverflowingDecimalsRejected) {
  std::string path, linkpath;
  std::uint64_t size = 0;
  bool has_size = false;
  EXPECT_THROW(detail::ApplyPaxRecords("18446744073709551626 path=x\n", path, linkpath, size, has_size),
               floability::exceptions::ExtractionError);
  const std::string huge_size = "size=99999999999999999999";
  const std::string record = std::to_string(huge_size.size() + 4) + " " + huge_size + "\n";
  ASSERT_EQ(record.size(), huge_size.size() + 4);
  EXPECT_THROW(detail::ApplyPaxRecords(record, path, linkpath, size, has_size),
               floability::exceptions::ExtractionError);
  EXPECT_FALSE(has_size);
}

TEST(TarReader, PaxLengthShorterThanPrefixRejected) {
  std::string path, linkpath;
  std::uint64_t size = 0;
  bool has_size = false;
  EXPECT_THROW(detail::ApplyPaxRecords("2 \n", path, linkpath, size, has_size),
               floability::exceptions::ExtractionError);
  EXPECT_THROW(detail::ApplyPaxRecords(" path=x\n", path, linkpath, size, has_size),
               floability::exceptions::ExtractionError);
}

TEST(TarReader, EmptyStreamIsNotATar) {
  StringSource src("");
  TarReader reader(src);
  TarMember m;
  EXPECT_THROW(reader.Next(m), floability::exceptions::ExtractionError);
}

TEST(TarReader, GarbageFailsChecksum) {
  StringSource src(std::string(1024, '\x5a'));
  TarReader reader(src);
  TarMember m;
  EXPECT_THROW(reader.Next(m), floability::exceptions::ExtractionError);
}

TEST(TarReader, TruncatedPayload) {
  auto tar = testutil::TarBuilder().File("a", std::string(2000, 'y')).Build();
  tar.resize(512 + 700);
  StringSource src(tar);
  TarReader reader(src);
  TarMember m;
  ASSERT_TRUE(reader.Next(m));
  EXPECT_THROW(reader.ReadPayload([](const std::uint8_t*, std::size_t) {}),
               floability::exceptions::ExtractionError);
}

TEST(TarReader, DetectCompressionMagic) {
  const std::uint8_t gz[] = {0x1f, 0x8b, 0x08};
  const std::uint8_t bz[] = {'B', 'Z', 'h'};
  const std::uint8_t xz[] = {0xfd, '7', 'z', 'X', 'Z', 0x00};
  const std::uint8_t plain[] = {'b', 'i', 'n', '/'};
  EXPECT_EQ(DetectCompression(gz, sizeof(gz)), Compression::Gzip);
  EXPECT_EQ(DetectCompression(bz, sizeof(bz)), Compression::Bzip2);
  EXPECT_EQ(DetectCompression(xz, sizeof(xz)), Compression::Xz);
  EXPECT_EQ(DetectCompression(plain, sizeof(plain)), Compression::None);
  EXPECT_EQ(DetectCompression(gz, 1), Compression::None);
}
