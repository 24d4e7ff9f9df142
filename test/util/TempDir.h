/***
 * Name: testutil::TempDir
 * Purpose: Scoped temporary directory removed at destruction.
 */
#pragma once

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "floability/support/fs.h"

namespace testutil {

class TempDir {
 public:
  explicit TempDir(const std::string& tag = "floability_test") {
    const std::string pattern = (std::filesystem::temp_directory_path() / (tag + "_XXXXXX")).string();
    std::vector<char> templ(pattern.begin(), pattern.end());
    templ.push_back('\0');
    if (mkdtemp(templ.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = templ.data();
  }
  ~TempDir() {
    std::string err;
    floability::support::RemoveTree(path_, err);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }
  std::string operator/(const std::string& rel) const { return (std::filesystem::path(path_) / rel).string(); }

 private:
  std::string path_;
};

}  // namespace testutil
