/***
 * Name: floability::launch::BatchTypeName / ParseBatchType
 * Purpose: Map batch system selectors to and from their command-line spelling.
 */
#include "floability/launch/launchers.h"

#include <initializer_list>
#include <string_view>

namespace floability {
namespace launch {

auto BatchTypeName(BatchType type) -> const char* {
  switch (type) {
    case BatchType::Local: return "local";
    case BatchType::Condor: return "condor";
    case BatchType::Uge: return "uge";
    case BatchType::Slurm: return "slurm";
  }
  return "local";
}

auto ParseBatchType(std::string_view text, BatchType& out) -> bool {
  for (const BatchType type : {BatchType::Local, BatchType::Condor, BatchType::Uge, BatchType::Slurm}) {
    if (text == BatchTypeName(type)) {
      out = type;
      return true;
    }
  }
  return false;
}

}  // namespace launch
}  // namespace floability
