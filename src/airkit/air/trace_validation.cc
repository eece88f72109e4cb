#include "airkit/air/trace_validation.h"

namespace airkit {

std::string TraceViolation::ToString() const {
  if (kind == ViolationKind::kAssertion) {
    return "assertion " + std::to_string(index) + " does not hold at step " +
           std::to_string(step) + ".";
  }
  return "transition constraint " + std::to_string(index) + " does not hold between steps " +
         std::to_string(step) + " and " + std::to_string(step + 1) + ".";
}

}  // namespace airkit
