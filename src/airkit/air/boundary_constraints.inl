#include <algorithm>
#include <map>
#include <numeric>
#include <tuple>

#include "airkit/algebra/field_operations.h"
#include "airkit/algebra/polynomials.h"
#include "airkit/error_handling/error_handling.h"

namespace airkit {

template <typename FieldElementT>
BoundaryConstraint<FieldElementT>::BoundaryConstraint(
    const Assertion& assertion, uint64_t trace_length,
    const std::pair<FieldElementT, FieldElementT>& coefficients)
    : column_(assertion.Column()), coefficients_(coefficients) {
  if (const auto* sequence = std::get_if<SequenceAssertion>(&assertion.Variant())) {
    // The roots of the divisor are g^first_step * (g^stride)^i, and g^stride generates the
    // subgroup of size values.size().
    const BaseFieldElement offset =
        Pow(GetSubGroupGenerator(trace_length), sequence->first_step);
    poly_coefs_ = InterpolateOnCoset<BaseFieldElement>(sequence->values, offset);
  } else {
    poly_coefs_ = {assertion.ValueAtStep(assertion.FirstStep(), trace_length)};
  }
}

template <typename FieldElementT>
FieldElementT BoundaryConstraint<FieldElementT>::EvaluateNumerator(
    const FieldElementT& x, const FieldElementT& trace_value) const {
  return trace_value - HornerEval<FieldElementT, BaseFieldElement>(x, poly_coefs_);
}

template <typename FieldElementT>
BoundaryConstraintGroup<FieldElementT>::BoundaryConstraintGroup(
    const ConstraintDivisor& divisor, const AirContext& context)
    : divisor_(divisor),
      degree_adjustment_(
          context.CompositionDegree() - (context.TracePolyDegree() - divisor.Degree())) {
  ASSERT_RELEASE(
      divisor_.Kind() == DivisorKind::kBoundary, "A boundary group requires a boundary divisor.");
}

template <typename FieldElementT>
void BoundaryConstraintGroup<FieldElementT>::AddConstraint(
    BoundaryConstraint<FieldElementT> constraint) {
  constraints_.push_back(std::move(constraint));
}

template <typename FieldElementT>
FieldElementT BoundaryConstraintGroup<FieldElementT>::MergeNumerators(
    const FieldElementT& x, gsl::span<const FieldElementT> trace_row,
    const FieldElementT& x_pow_adjustment) const {
  FieldElementT res = FieldElementT::Zero();
  for (const auto& constraint : constraints_) {
    const auto& [alpha, beta] = constraint.Coefficients();
    const FieldElementT numerator =
        constraint.EvaluateNumerator(x, trace_row[constraint.Column()]);
    res += numerator * (alpha + beta * x_pow_adjustment);
  }
  return res;
}

template <typename FieldElementT>
FieldElementT BoundaryConstraintGroup<FieldElementT>::EvaluateAt(
    const FieldElementT& x, gsl::span<const FieldElementT> trace_row) const {
  const FieldElementT divisor_value = divisor_.EvaluateAt(x);
  ASSERT_RELEASE(
      divisor_value != FieldElementT::Zero(),
      "Cannot evaluate a boundary constraint on a root of its divisor.");
  return MergeNumerators(x, trace_row, Pow(x, degree_adjustment_)) / divisor_value;
}

template <typename FieldElementT>
std::vector<BoundaryConstraintGroup<FieldElementT>> BuildBoundaryConstraintGroups(
    const std::vector<Assertion>& assertions, const AirContext& context,
    gsl::span<const std::pair<FieldElementT, FieldElementT>> coefficients) {
  ASSERT_RELEASE(
      coefficients.size() == assertions.size(),
      "Expected " + std::to_string(assertions.size()) +
          " boundary coefficient pairs, got " + std::to_string(coefficients.size()) + ".");
  const uint64_t trace_length = context.TraceLength();

  std::vector<ConstraintDivisor> divisors;
  divisors.reserve(assertions.size());
  for (const Assertion& assertion : assertions) {
    divisors.push_back(ConstraintDivisor::ForAssertion(assertion, trace_length));
  }

  std::vector<size_t> order(assertions.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (divisors[a] != divisors[b]) {
      return divisors[a] < divisors[b];
    }
    return assertions[a].Column() < assertions[b].Column();
  });

  std::map<ConstraintDivisor, BoundaryConstraintGroup<FieldElementT>> groups;
  for (size_t i = 0; i < order.size(); ++i) {
    const size_t idx = order[i];
    auto it = groups.find(divisors[idx]);
    if (it == groups.end()) {
      it = groups
               .emplace(
                   divisors[idx], BoundaryConstraintGroup<FieldElementT>(divisors[idx], context))
               .first;
    }
    it->second.AddConstraint(
        BoundaryConstraint<FieldElementT>(assertions[idx], trace_length, coefficients[i]));
  }

  std::vector<BoundaryConstraintGroup<FieldElementT>> res;
  res.reserve(groups.size());
  for (auto& entry : groups) {
    res.push_back(std::move(entry.second));
  }
  return res;
}

}  // namespace airkit
