#include <map>

#include "airkit/error_handling/error_handling.h"

namespace airkit {

template <typename FieldElementT>
TransitionConstraintGroup<FieldElementT>::TransitionConstraintGroup(
    uint64_t evaluation_degree, const AirContext& context)
    : evaluation_degree_(evaluation_degree),
      degree_adjustment_(
          context.CompositionDegree() + context.TracePolyDegree() - evaluation_degree) {
  ASSERT_RELEASE(
      evaluation_degree_ >= context.TracePolyDegree() &&
          evaluation_degree_ <= context.CompositionDegree() + context.TracePolyDegree(),
      "Transition constraint degree " + std::to_string(evaluation_degree_) +
          " does not fit the composition degree.");
}

template <typename FieldElementT>
void TransitionConstraintGroup<FieldElementT>::AddConstraint(
    size_t index, const std::pair<FieldElementT, FieldElementT>& coefficients) {
  ASSERT_RELEASE(
      indices_.empty() || indices_.back() < index, "Constraints must be added in order.");
  indices_.push_back(index);
  coefficients_.push_back(coefficients);
}

template <typename FieldElementT>
FieldElementT TransitionConstraintGroup<FieldElementT>::MergeEvaluations(
    gsl::span<const FieldElementT> evaluations, const FieldElementT& x_pow_adjustment) const {
  FieldElementT res = FieldElementT::Zero();
  for (size_t i = 0; i < indices_.size(); ++i) {
    const auto& [alpha, beta] = coefficients_[i];
    res += evaluations[indices_[i]] * (alpha + beta * x_pow_adjustment);
  }
  return res;
}

template <typename FieldElementT>
std::vector<TransitionConstraintGroup<FieldElementT>> BuildTransitionConstraintGroups(
    const AirContext& context,
    gsl::span<const std::pair<FieldElementT, FieldElementT>> coefficients) {
  const auto& degrees = context.TransitionConstraintDegrees();
  ASSERT_RELEASE(
      coefficients.size() == degrees.size(),
      "Expected " + std::to_string(degrees.size()) + " transition coefficient pairs, got " +
          std::to_string(coefficients.size()) + ".");

  std::map<uint64_t, TransitionConstraintGroup<FieldElementT>> groups;
  for (size_t i = 0; i < degrees.size(); ++i) {
    const uint64_t evaluation_degree = degrees[i].EvaluationDegree(context.TraceLength());
    auto it = groups.find(evaluation_degree);
    if (it == groups.end()) {
      it = groups
               .emplace(
                   evaluation_degree,
                   TransitionConstraintGroup<FieldElementT>(evaluation_degree, context))
               .first;
    }
    it->second.AddConstraint(i, coefficients[i]);
  }

  std::vector<TransitionConstraintGroup<FieldElementT>> res;
  res.reserve(groups.size());
  for (auto& entry : groups) {
    res.push_back(std::move(entry.second));
  }
  return res;
}

}  // namespace airkit
