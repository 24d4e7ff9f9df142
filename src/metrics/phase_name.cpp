/***
 * Name: floability::metrics::Metrics::PhaseName
 * Purpose: Map a Phase to its display name for text and JSON reports.
 * Inputs: phase
 * Outputs: Static C string
 */
#include "floability/metrics/metrics.h"

namespace floability::metrics {

auto Metrics::PhaseName(Phase phase) -> const char* {
  switch (phase) {
    case Phase::Allocate: return "Allocate";
    case Phase::FetchData: return "FetchData";
    case Phase::Materialize: return "Materialize";
    case Phase::Extract: return "Extract";
    case Phase::WriteActivation: return "WriteActivation";
    case Phase::Fixup: return "Fixup";
    case Phase::Spawn: return "Spawn";
    case Phase::Supervise: return "Supervise";
    case Phase::Cleanup: return "Cleanup";
  }
  return "Unknown";
}

}  // namespace floability::metrics
