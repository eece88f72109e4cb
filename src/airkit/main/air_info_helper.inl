#include <memory>
#include <utility>

#include "glog/logging.h"

#include "airkit/air/air.h"
#include "airkit/air/coefficient_generator.h"
#include "airkit/air/trace.h"
#include "airkit/air/trace_validation.h"
#include "airkit/algebra/fields/base_field_element.h"
#include "airkit/algebra/fields/cubic_extension_field_element.h"
#include "airkit/algebra/fields/quadratic_extension_field_element.h"
#include "airkit/algebra/polynomials.h"
#include "airkit/composition_polynomial/constraint_evaluator.h"
#include "airkit/error_handling/error_handling.h"
#include "airkit/utils/profiling.h"
#include "airkit/utils/to_from_string.h"

namespace airkit {

namespace air_info {
namespace details {

/*
  Evaluates the composition polynomial of a valid trace on a coset of twice the composition domain
  size, and returns its degree.
*/
template <typename AirT, typename FieldElementT>
int64_t EvaluateCompositionDegree(
    const AirT& air, const Trace& trace,
    const ConstraintEvaluator<AirT, FieldElementT>& evaluator) {
  ProfilingBlock profiling_block("Constraint evaluation");
  const uint64_t coset_size = 2 * air.Context().CeDomainSize();
  const BaseFieldElement offset = AirContext::DomainOffset();

  std::vector<std::vector<BaseFieldElement>> trace_evaluations;
  trace_evaluations.reserve(trace.Width());
  for (size_t i = 0; i < trace.Width(); ++i) {
    const std::vector<BaseFieldElement> coefs =
        InterpolateOnCoset<BaseFieldElement>(trace.GetColumn(i), BaseFieldElement::One());
    trace_evaluations.push_back(EvaluateOnCoset<BaseFieldElement>(coefs, coset_size, offset));
  }

  std::vector<FieldElementT> evaluation = FieldElementT::UninitializedVector(coset_size);
  evaluator.EvalOnCoset(
      offset,
      std::vector<gsl::span<const BaseFieldElement>>(
          trace_evaluations.begin(), trace_evaluations.end()),
      evaluation);
  return PolynomialDegree<FieldElementT>(InterpolateOnCoset<FieldElementT>(evaluation, offset));
}

/*
  Adds the constraint groups and the composition degree, over the coefficient field FieldElementT,
  to the summary.
*/
template <typename AirT, typename FieldElementT>
void DescribeComposition(
    const AirT& air, const Trace& trace, gsl::span<const std::byte> public_seed,
    JsonBuilder* summary) {
  const AirContext& context = air.Context();
  const CoefficientGenerator generator(public_seed);
  const ConstraintCompositionCoefficients<FieldElementT> coefficients =
      generator.GetConstraintCompositionCoefficients<FieldElementT>(
          context.NumTransitionConstraints(), air.NumBoundaryConstraints());
  const DeepCompositionCoefficients<FieldElementT> deep_coefficients =
      generator.GetDeepCompositionCoefficients<FieldElementT>(
          context.NumTransitionConstraints(), air.NumBoundaryConstraints(), context.TraceWidth(),
          context.NumCompositionColumns());
  const ConstraintEvaluator<AirT, FieldElementT> evaluator(air, coefficients);

  (*summary)["transition_groups"] = JsonValue::EmptyArray();
  for (const auto& group : evaluator.TransitionGroups()) {
    JsonBuilder group_json;
    group_json["evaluation_degree"] = group.EvaluationDegree();
    group_json["degree_adjustment"] = group.DegreeAdjustment();
    group_json["constraints"] = JsonValue::EmptyArray();
    for (const size_t index : group.Indices()) {
      group_json["constraints"].Append(index);
    }
    (*summary)["transition_groups"].Append(group_json.Build());
    LOG(INFO) << "Transition group of degree " << group.EvaluationDegree() << ": "
              << group.Indices().size() << " constraints, degree adjustment "
              << group.DegreeAdjustment() << ".";
  }

  (*summary)["boundary_groups"] = JsonValue::EmptyArray();
  for (const auto& group : evaluator.BoundaryGroups()) {
    JsonBuilder group_json;
    group_json["divisor"] = group.Divisor().ToString();
    group_json["degree_adjustment"] = group.DegreeAdjustment();
    group_json["columns"] = JsonValue::EmptyArray();
    for (const auto& constraint : group.Constraints()) {
      group_json["columns"].Append(constraint.Column());
    }
    (*summary)["boundary_groups"].Append(group_json.Build());
    LOG(INFO) << "Boundary group with divisor " << group.Divisor() << ": "
              << group.Constraints().size() << " constraints, degree adjustment "
              << group.DegreeAdjustment() << ".";
  }

  const size_t num_deep_coefficients =
      deep_coefficients.trace.size() + deep_coefficients.composition.size() + 1;
  (*summary)["num_deep_coefficient_pairs"] = num_deep_coefficients;

  const int64_t composition_degree = EvaluateCompositionDegree(air, trace, evaluator);
  ASSERT_RELEASE(
      composition_degree == static_cast<int64_t>(context.CompositionDegree()),
      "The composition polynomial has degree " + std::to_string(composition_degree) +
          ", expected " + std::to_string(context.CompositionDegree()) + ".");
  (*summary)["composition_degree"] = composition_degree;
  LOG(INFO) << "Composition polynomial degree: " << composition_degree << ".";
}

}  // namespace details
}  // namespace air_info

template <typename AirT>
JsonValue GetAirInfo(
    uint64_t trace_length, const typename AirT::PublicInputs& public_inputs,
    const ProofParameters& proof_parameters) {
  using air_info::details::DescribeComposition;

  ProfilingBlock build_block("Build AIR");
  const TraceInfo trace_info(AirT::kNumColumns, trace_length);
  const std::unique_ptr<AirT> air = BuildAir<AirT>(trace_info, public_inputs, proof_parameters);
  const AirContext& context = air->Context();
  build_block.CloseBlock();

  ProfilingBlock trace_block("Trace generation");
  const Trace trace = air->GetTrace();
  ValidateTrace(*air, trace);
  trace_block.CloseBlock();
  LOG(INFO) << "Generated a valid trace of shape " << trace_info << ".";

  JsonBuilder summary;
  summary["trace"]["width"] = trace_info.Width();
  summary["trace"]["length"] = trace_info.Length();
  summary["proof_parameters"] = proof_parameters.ToJson();
  const JsonValue public_input_json = public_inputs.ToJson();
  summary["public_input"] = public_input_json;
  summary["timings"]["build_air_sec"] = build_block.Duration().count();
  summary["timings"]["trace_generation_sec"] = trace_block.Duration().count();

  summary["context"]["max_constraint_degree"] = context.MaxConstraintDegree();
  summary["context"]["ce_blowup_factor"] = context.CeBlowupFactor();
  summary["context"]["composition_degree"] = context.CompositionDegree();
  summary["context"]["lde_domain_size"] = context.LdeDomainSize();
  summary["context"]["num_composition_columns"] = context.NumCompositionColumns();
  LOG(INFO) << "Composition degree " << context.CompositionDegree() << " (blowup "
            << context.CeBlowupFactor() << "), LDE domain of size " << context.LdeDomainSize()
            << ".";

  summary["transition_constraints"] = JsonValue::EmptyArray();
  for (const auto& degree : context.TransitionConstraintDegrees()) {
    summary["transition_constraints"].Append(degree.ToString());
  }
  summary["transition_divisor"] = air->TransitionDivisor().ToString();
  summary["assertions"] = JsonValue::EmptyArray();
  for (const Assertion& assertion : air->GetNormalizedAssertions()) {
    summary["assertions"].Append(assertion.ToString());
  }

  const std::vector<std::byte> public_seed = GetPublicSeed(proof_parameters, public_input_json);
  summary["public_seed"] = BytesToHexString(public_seed, false);

  switch (proof_parameters.GetFieldExtension()) {
    case FieldExtension::kNone:
      DescribeComposition<AirT, BaseFieldElement>(*air, trace, public_seed, &summary);
      break;
    case FieldExtension::kQuadratic:
      DescribeComposition<AirT, QuadraticExtensionFieldElement>(
          *air, trace, public_seed, &summary);
      break;
    case FieldExtension::kCubic:
      DescribeComposition<AirT, CubicExtensionFieldElement>(*air, trace, public_seed, &summary);
      break;
  }
  return summary.Build();
}

}  // namespace airkit
