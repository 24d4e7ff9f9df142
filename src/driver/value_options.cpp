/***
 * Name: floability::driver::detail::ValueOptions
 * Purpose: Table of value-taking options and how each one is applied.
 * Inputs: N/A
 * Outputs: Static table
 * Theory of Operation: Numeric values are parsed and range-checked in one step
 *   (ParseBoundedInt / ParseDuration), so an accepted value is always usable.
 */
#include "floability/driver/cli_parse.h"

#include <chrono>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

#include "floability/launch/launchers.h"
#include "floability/support/parse.h"

namespace floability {
namespace driver {
namespace detail {

constexpr support::IntBounds kCountBounds{1, std::numeric_limits<int>::max()};
constexpr support::IntBounds kPortBounds{1, 65535};
constexpr std::chrono::milliseconds kMinPollInterval{100};

static void ReportInvalid(const char* name, const std::string& value, const std::string& why, std::ostream& err) {
  err << "floability: error: invalid value '" << value << "' for " << name << ": " << why << '\n';
}

static bool ApplyInt(const char* name, const std::string& value, support::IntBounds bounds, int& out,
                     std::ostream& err) {
  std::string why;
  if (!support::ParseBoundedInt(value, bounds, out, &why)) {
    ReportInvalid(name, value, why, err);
    return false;
  }
  return true;
}

static bool ApplyDuration(const char* name, const std::string& value, std::chrono::milliseconds min,
                          std::chrono::milliseconds& out, std::ostream& err) {
  std::string why;
  if (!support::ParseDuration(value, min, out, &why)) {
    ReportInvalid(name, value, why, err);
    return false;
  }
  return true;
}

static bool ApplyNonEmpty(const char* name, const std::string& value, std::ostream& err) {
  if (value.empty()) {
    err << "floability: error: empty value for " << name << '\n';
    return false;
  }
  return true;
}

auto ValueOptions() -> const std::vector<ValueOption>& {
  static const std::vector<ValueOption> kOptions{
      {"--environment",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         d.environment = v;
         return ApplyNonEmpty("--environment", v, e);
       }},
      {"--notebook",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         d.notebook = v;
         return ApplyNonEmpty("--notebook", v, e);
       }},
      {"--batch-type",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         if (!launch::ParseBatchType(v, d.batch_type)) {
           e << "floability: error: unknown batch type '" << v << "' (expected local, condor, uge or slurm)" << '\n';
           return false;
         }
         return true;
       }},
      {"--workers",
       [](const std::string& v, RunOptions& d, std::ostream& e) { return ApplyInt("--workers", v, kCountBounds, d.workers, e); }},
      {"--cores-per-worker",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         return ApplyInt("--cores-per-worker", v, kCountBounds, d.cores_per_worker, e);
       }},
      {"--manager-name",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         d.manager_name = v;
         return ApplyNonEmpty("--manager-name", v, e);
       }},
      {"--jupyter-port",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         return ApplyInt("--jupyter-port", v, kPortBounds, d.jupyter_port, e);
       }},
      {"--base-dir",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         d.base_dir = v;
         return ApplyNonEmpty("--base-dir", v, e);
       }},
      {"--data-spec",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         d.data_spec = v;
         return ApplyNonEmpty("--data-spec", v, e);
       }},
      {"--backpack-root",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         d.backpack_root = v;
         return ApplyNonEmpty("--backpack-root", v, e);
       }},
      {"--poll-interval",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         return ApplyDuration("--poll-interval", v, kMinPollInterval, d.poll_interval, e);
       }},
      {"--grace-period",
       [](const std::string& v, RunOptions& d, std::ostream& e) {
         return ApplyDuration("--grace-period", v, std::chrono::milliseconds(0), d.grace_period, e);
       }},
  };
  return kOptions;
}

}  // namespace detail
}  // namespace driver
}  // namespace floability
