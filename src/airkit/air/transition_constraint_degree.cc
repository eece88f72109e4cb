#include "airkit/air/transition_constraint_degree.h"

#include <sstream>
#include <utility>

#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"
#include "airkit/stl_utils/containers.h"

namespace airkit {

TransitionConstraintDegree::TransitionConstraintDegree(
    size_t base_degree, std::vector<uint64_t> cycles)
    : base_degree_(base_degree), cycles_(std::move(cycles)) {
  ASSERT_RELEASE(base_degree_ >= 1, "Transition constraint degree must be at least 1.");
  ASSERT_RELEASE(
      base_degree_ <= kMaxBaseDegree, "Transition constraint degree must not exceed " +
                                          std::to_string(kMaxBaseDegree) + ", got " +
                                          std::to_string(base_degree_) + ".");
  for (const uint64_t cycle : cycles_) {
    ASSERT_RELEASE(
        cycle >= 2 && IsPowerOfTwo(cycle),
        "Cycle length must be a power of 2 and at least 2, got " + std::to_string(cycle) + ".");
  }
}

uint64_t TransitionConstraintDegree::MinBlowupFactor() const {
  return NextPowerOfTwo(MaxDegree());
}

uint64_t TransitionConstraintDegree::EvaluationDegree(uint64_t trace_length) const {
  uint64_t degree = base_degree_ * (trace_length - 1);
  for (const uint64_t cycle : cycles_) {
    ASSERT_RELEASE(
        cycle <= trace_length,
        "Cycle length " + std::to_string(cycle) + " exceeds the trace length " +
            std::to_string(trace_length) + ".");
    degree += SafeDiv(trace_length, cycle) * (cycle - 1);
  }
  return degree;
}

std::string TransitionConstraintDegree::ToString() const {
  std::stringstream ss;
  ss << "TransitionConstraintDegree(base: " << base_degree_ << ", cycles: " << cycles_ << ")";
  return ss.str();
}

}  // namespace airkit
