/***
 * Name: floability::metrics::Metrics::reg_
 * Purpose: Define the static metrics registry storage and its lock.
 * Inputs: N/A
 * Outputs: Singleton-style storage for metrics across stages.
 * Theory of Operation: One definition for the class-declared static members.
 */
#include "floability/metrics/metrics.h"

namespace floability {
namespace metrics {

Metrics::Registry Metrics::reg_{};
std::mutex Metrics::mutex_{};

}  // namespace metrics
}  // namespace floability
