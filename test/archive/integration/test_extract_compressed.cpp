/***
 * Name: test_extract_compressed
 * Purpose: Extract the same tree from plain, gzip, bzip2, and xz archives and compare contents.
 */
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <filesystem>
#include <functional>
#include <string>
#include "floability/archive/extractor.h"
#include "floability/exceptions/extraction_error.h"
#include "floability/metrics/metrics.h"
#include "util/TarBuilder.h"
#include "util/TempDir.h"

namespace fs = std::filesystem;
using floability::archive::ExtractArchive;

namespace {

std::string SampleEnvironment() {
  return testutil::TarBuilder()
      .Directory("./")
      .Directory("bin/")
      .File("bin/python", "#!/bin/sh\necho python\n", 0755)
      .Directory("etc/conda/activate.d/")
      .File("etc/conda/activate.d/env_vars.sh", "export FOO=bar")
      .File("lib/deep/nested/data.bin", std::string(70000, '\x01'))
      .File("share/readonly.txt", "ro", 0444)
      .Symlink("bin/python3", "python")
      .Fifo("tmp/fifo")
      .Build();
}

void ExpectSampleTree(const std::string& root) {
  EXPECT_EQ(testutil::ReadBytes(root + "/bin/python"), "#!/bin/sh\necho python\n");
  EXPECT_EQ(testutil::ReadBytes(root + "/etc/conda/activate.d/env_vars.sh"), "export FOO=bar");
  EXPECT_EQ(fs::file_size(root + "/lib/deep/nested/data.bin"), 70000u);
  EXPECT_TRUE(fs::is_symlink(root + "/bin/python3"));
  EXPECT_FALSE(fs::exists(root + "/tmp/fifo"));
  struct stat st {};
  ASSERT_EQ(::stat((root + "/bin/python").c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0755u);
  ASSERT_EQ(::stat((root + "/share/readonly.txt").c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0644u);
}

void RoundTrip(const std::string& file_name, const std::function<std::string(const std::string&)>& encode) {
  testutil::TempDir tmp("floability_compressed");
  const std::string archive = tmp / file_name;
  const std::string root = tmp / "env";
  fs::create_directories(root);
  testutil::WriteBytes(archive, encode(SampleEnvironment()));
  ASSERT_NO_THROW(ExtractArchive(archive, root));
  ExpectSampleTree(root);
}

}  // namespace

TEST(ExtractCompressed, PlainTar) {
  RoundTrip("env.tar", [](const std::string& s) { return s; });
}

TEST(ExtractCompressed, Gzip) { RoundTrip("env.tar.gz", testutil::Gzip); }

TEST(ExtractCompressed, Bzip2) { RoundTrip("env.tar.bz2", testutil::Bzip2); }

TEST(ExtractCompressed, Xz) { RoundTrip("env.tar.xz", testutil::Xz); }

TEST(ExtractCompressed, ConcatenatedGzipMembers) {
  // pigz-style output: the tar stream split across two gzip members.
  const std::string tar = SampleEnvironment();
  const std::size_t cut = 1024;
  RoundTrip("env.tgz", [&](const std::string&) {
    return testutil::Gzip(tar.substr(0, cut)) + testutil::Gzip(tar.substr(cut));
  });
}

TEST(ExtractCompressed, EncodingSniffedNotNamed) {
  // gzip bytes behind a .tar.xz name still extract.
  RoundTrip("misnamed.tar.xz", testutil::Gzip);
}

TEST(ExtractCompressed, CorruptGzipFails) {
  testutil::TempDir tmp("floability_compressed");
  std::string bytes = testutil::Gzip(SampleEnvironment());
  for (std::size_t i = 20; i < bytes.size() && i < 200; ++i) bytes[i] = static_cast<char>(~bytes[i]);
  testutil::WriteBytes(tmp / "bad.tar.gz", bytes);
  fs::create_directories(tmp / "env");
  EXPECT_THROW(ExtractArchive(tmp / "bad.tar.gz", tmp / "env"), floability::exceptions::ExtractionError);
}

TEST(ExtractCompressed, TruncatedXzFails) {
  testutil::TempDir tmp("floability_compressed");
  std::string bytes = testutil::Xz(SampleEnvironment());
  bytes.resize(bytes.size() / 2);
  testutil::WriteBytes(tmp / "cut.tar.xz", bytes);
  fs::create_directories(tmp / "env");
  EXPECT_THROW(ExtractArchive(tmp / "cut.tar.xz", tmp / "env"), floability::exceptions::ExtractionError);
}

TEST(ExtractCompressed, CountsMembersWhenMetricsEnabled) {
  using floability::metrics::Metrics;
  Metrics::Enable(true);
  Metrics::Reset();
  RoundTrip("env.tar", [](const std::string& s) { return s; });
  const auto reg = Metrics::Snapshot();
  Metrics::Enable(false);
  ASSERT_EQ(reg.counters.count("archive.members"), 1u);
  EXPECT_EQ(reg.counters.at("archive.members"), 9u);
  EXPECT_EQ(reg.counters.at("archive.skipped"), 1u);
}
