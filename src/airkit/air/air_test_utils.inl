#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/algebra/polynomials.h"
#include "airkit/composition_polynomial/constraint_evaluator.h"
#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"

namespace airkit {

template <typename FieldElementT>
ConstraintCompositionCoefficients<FieldElementT> RandomCompositionCoefficients(
    const Air& air, Prng* prng) {
  const auto draw_pairs = [prng](size_t n_pairs) {
    std::vector<std::pair<FieldElementT, FieldElementT>> pairs;
    pairs.reserve(n_pairs);
    for (size_t i = 0; i < n_pairs; ++i) {
      const FieldElementT alpha = FieldElementT::RandomElement(prng);
      pairs.emplace_back(alpha, FieldElementT::RandomElement(prng));
    }
    return pairs;
  };
  ConstraintCompositionCoefficients<FieldElementT> coefficients;
  coefficients.transition = draw_pairs(air.Context().NumTransitionConstraints());
  coefficients.boundary = draw_pairs(air.NumBoundaryConstraints());
  return coefficients;
}

template <typename AirT, typename FieldElementT>
int64_t ComputeCompositionDegree(
    const AirT& air, const Trace& trace,
    const ConstraintCompositionCoefficients<FieldElementT>& coefficients,
    const size_t num_of_cosets) {
  const AirContext& context = air.Context();
  ASSERT_RELEASE(
      trace.GetTraceInfo() == context.GetTraceInfo(), "The trace does not match the AIR.");

  // Evaluation domain.
  const uint64_t evaluation_domain_size =
      Pow2(Log2Ceil(context.CeDomainSize() * num_of_cosets));
  const BaseFieldElement offset = AirContext::DomainOffset();

  // Trace low degree extension.
  std::vector<std::vector<BaseFieldElement>> trace_lde;
  trace_lde.reserve(trace.Width());
  for (size_t i = 0; i < trace.Width(); ++i) {
    const std::vector<BaseFieldElement> coefs =
        InterpolateOnCoset<BaseFieldElement>(trace.GetColumn(i), BaseFieldElement::One());
    trace_lde.push_back(
        EvaluateOnCoset<BaseFieldElement>(coefs, evaluation_domain_size, offset));
  }

  // Evaluate composition.
  const ConstraintEvaluator<AirT, FieldElementT> evaluator(air, coefficients);
  std::vector<FieldElementT> evaluation =
      FieldElementT::UninitializedVector(evaluation_domain_size);
  constexpr uint64_t kTaskSize = 256;
  evaluator.EvalOnCoset(
      offset, std::vector<gsl::span<const BaseFieldElement>>(trace_lde.begin(), trace_lde.end()),
      evaluation, kTaskSize);

  // Compute degree.
  const std::vector<FieldElementT> composition_coefs =
      InterpolateOnCoset<FieldElementT>(evaluation, offset);
  return PolynomialDegree<FieldElementT>(composition_coefs);
}

}  // namespace airkit
