/***
 * Name: floability::process::detail::BuildEnvironment
 * Purpose: Compute the child environment: inherited variables plus overrides.
 * Inputs: overrides (later entries win)
 * Outputs: KEY=VALUE strings
 * Theory of Operation: Keyed by name so an override replaces, rather than
 *   duplicates, an inherited variable.
 */
#include "floability/process/detail/exec.h"

#include <map>
#include <utility>
#include <string>
#include <vector>

extern char** environ;  // NOLINT(readability-redundant-declaration)

namespace floability {
namespace process {
namespace detail {

auto BuildEnvironment(const std::vector<EnvVar>& overrides) -> std::vector<std::string> {
  std::map<std::string, std::string> entries;
  for (char** cursor = environ; cursor != nullptr && *cursor != nullptr; ++cursor) {
    const std::string entry(*cursor);
    const auto pos = entry.find('=');
    if (pos == std::string::npos) {
      continue;
    }
    entries[entry.substr(0, pos)] = entry;
  }
  for (const auto& var : overrides) {
    entries[var.key] = var.key + "=" + var.value;
  }
  std::vector<std::string> out;
  out.reserve(entries.size());
  for (auto& kv : entries) {
    out.push_back(std::move(kv.second));
  }
  return out;
}

}  // namespace detail
}  // namespace process
}  // namespace floability
