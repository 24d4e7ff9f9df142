/***
 * Name: floability::rundir::AllocateRunDirectory
 * Purpose: Atomically create a never-before-used run directory under base_dir.
 * Inputs:
 *   - base_dir: existing, writable directory
 *   - prefix: leading name component (e.g. "floability_run")
 * Outputs:
 *   - Absolute path of the created directory
 * Theory of Operation: Validates base_dir, then lets mkdtemp(3) generate the random
 *   suffix and create the directory atomically. The timestamp is only for humans
 *   browsing the base directory; uniqueness comes from mkdtemp.
 */
#include "floability/rundir/allocator.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "floability/exceptions/allocation_error.h"
#include "floability/metrics/metrics.h"

namespace floability::rundir {

namespace fs = std::filesystem;

static std::string TimestampTag() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[32];
  const std::size_t len = std::strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &local);
  return std::string(buffer, len);
}

auto AllocateRunDirectory(const std::string& base_dir, const std::string& prefix) -> std::string {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Allocate);
  if (prefix.find('/') != std::string::npos) {
    throw exceptions::AllocationError("run directory prefix must not contain '/': " + prefix);
  }
  std::error_code ec;
  const fs::path base = fs::absolute(base_dir, ec);
  if (ec || !fs::is_directory(base, ec)) {
    throw exceptions::AllocationError("base directory does not exist: " + base_dir);
  }
  if (access(base.c_str(), W_OK | X_OK) != 0) {
    throw exceptions::AllocationError("base directory is not writable: " + base_dir + ": " +
                                      std::strerror(errno));
  }

  const std::string pattern = (base / (prefix + "_" + TimestampTag() + "_XXXXXX")).string();
  std::vector<char> templ(pattern.begin(), pattern.end());
  templ.push_back('\0');
  if (mkdtemp(templ.data()) == nullptr) {
    throw exceptions::AllocationError("failed to create run directory under " + base_dir + ": " +
                                      std::strerror(errno));
  }
  return std::string(templ.data());
}

}  // namespace floability::rundir
