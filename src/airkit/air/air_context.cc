#include "airkit/air/air_context.h"

#include <algorithm>
#include <utility>

#include "glog/logging.h"

#include "airkit/algebra/field_operations.h"
#include "airkit/error_handling/error_handling.h"

namespace airkit {

namespace {

size_t ComputeMaxConstraintDegree(const std::vector<TransitionConstraintDegree>& degrees) {
  ASSERT_RELEASE(!degrees.empty(), "A computation must have at least one transition constraint.");
  size_t max_degree = 0;
  for (const auto& degree : degrees) {
    max_degree = std::max(max_degree, degree.MaxDegree());
  }
  return max_degree;
}

}  // namespace

AirContext::AirContext(
    TraceInfo trace_info, std::vector<TransitionConstraintDegree> transition_constraint_degrees,
    size_t num_assertions, ProofParameters proof_parameters)
    : trace_info_(trace_info),
      transition_constraint_degrees_(std::move(transition_constraint_degrees)),
      num_assertions_(num_assertions),
      proof_parameters_(std::move(proof_parameters)),
      max_constraint_degree_(ComputeMaxConstraintDegree(transition_constraint_degrees_)),
      ce_blowup_factor_(NextPowerOfTwo(max_constraint_degree_)),
      trace_generator_(GetSubGroupGenerator(trace_info_.Length())),
      lde_domain_generator_(GetSubGroupGenerator(LdeDomainSize())) {
  ASSERT_RELEASE(num_assertions_ > 0, "A computation must have at least one assertion.");
  for (const auto& degree : transition_constraint_degrees_) {
    // Validates that every cycle divides the trace length.
    degree.EvaluationDegree(TraceLength());
  }
  ASSERT_RELEASE(
      ce_blowup_factor_ <= BlowupFactor(),
      "The blowup factor " + std::to_string(BlowupFactor()) +
          " is smaller than the minimum blowup factor " + std::to_string(ce_blowup_factor_) +
          " required by the transition constraint degrees.");

  VLOG(1) << "AirContext: " << trace_info_ << ", "
          << transition_constraint_degrees_.size() << " transition constraints, "
          << num_assertions_ << " assertions, max constraint degree " << max_constraint_degree_
          << ", CE blowup factor " << ce_blowup_factor_ << ", composition degree "
          << CompositionDegree() << ", LDE domain size " << LdeDomainSize() << ".";
}

}  // namespace airkit
