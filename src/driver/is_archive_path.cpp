/***
 * Name: floability::driver::IsArchivePath
 * Purpose: Classify an --environment value by its file name.
 * Inputs: path
 * Outputs: true for packed-environment archive names
 * Theory of Operation: Only the name decides the dispatch; the archive's actual
 *   encoding is sniffed from its contents at extraction time.
 */
#include "floability/driver/app.h"

#include <array>
#include <string>
#include <string_view>

namespace floability::driver {

auto IsArchivePath(const std::string& path) -> bool {
  static constexpr std::array<std::string_view, 7> kSuffixes{".tar.gz", ".tgz",    ".tar.bz2", ".tbz2",
                                                             ".tar.xz", ".txz", ".tar"};
  for (const auto suffix : kSuffixes) {
    if (path.size() > suffix.size() && path.ends_with(suffix)) {
      return true;
    }
  }
  return false;
}

}  // namespace floability::driver
