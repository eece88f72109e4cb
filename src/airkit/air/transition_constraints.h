#ifndef AIRKIT_AIR_TRANSITION_CONSTRAINTS_H_
#define AIRKIT_AIR_TRANSITION_CONSTRAINTS_H_

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/air_context.h"

namespace airkit {

/*
  The transition constraints of the same evaluation degree D (see
  TransitionConstraintDegree::EvaluationDegree()). All transition constraints share the
  transition divisor, of degree n - 1, so their contribution to the composition polynomial is
    sum_i (alpha_i + beta_i * x^k) * C_i(x) / Z(x),
  with the degree adjustment k = CompositionDegree() + (n - 1) - D.
  Constraints of equal degree share k, which lets the prover compute x^k once per group.
*/
template <typename FieldElementT>
class TransitionConstraintGroup {
 public:
  TransitionConstraintGroup(uint64_t evaluation_degree, const AirContext& context);

  void AddConstraint(size_t index, const std::pair<FieldElementT, FieldElementT>& coefficients);

  uint64_t EvaluationDegree() const { return evaluation_degree_; }
  uint64_t DegreeAdjustment() const { return degree_adjustment_; }

  /*
    Indices of the constraints in the result of EvaluateTransition(), in increasing order.
  */
  const std::vector<size_t>& Indices() const { return indices_; }
  const std::vector<std::pair<FieldElementT, FieldElementT>>& Coefficients() const {
    return coefficients_;
  }

  /*
    Returns sum_i (alpha_i + beta_i * x^k) * evaluations[Indices()[i]], given
    x_pow_adjustment = x^k. The division by the transition divisor is left to the caller, who
    shares it between all groups.
  */
  FieldElementT MergeEvaluations(
      gsl::span<const FieldElementT> evaluations, const FieldElementT& x_pow_adjustment) const;

 private:
  uint64_t evaluation_degree_;
  uint64_t degree_adjustment_;
  std::vector<size_t> indices_;
  std::vector<std::pair<FieldElementT, FieldElementT>> coefficients_;
};

/*
  Groups the transition constraints of the context by evaluation degree, in increasing degree
  order. coefficients[i] belongs to the i-th transition constraint.
*/
template <typename FieldElementT>
std::vector<TransitionConstraintGroup<FieldElementT>> BuildTransitionConstraintGroups(
    const AirContext& context,
    gsl::span<const std::pair<FieldElementT, FieldElementT>> coefficients);

}  // namespace airkit

#include "airkit/air/transition_constraints.inl"

#endif  // AIRKIT_AIR_TRANSITION_CONSTRAINTS_H_
