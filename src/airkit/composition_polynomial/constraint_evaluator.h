#ifndef AIRKIT_COMPOSITION_POLYNOMIAL_CONSTRAINT_EVALUATOR_H_
#define AIRKIT_COMPOSITION_POLYNOMIAL_CONSTRAINT_EVALUATOR_H_

#include <cstdint>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/air.h"
#include "airkit/air/boundary_constraints.h"
#include "airkit/air/coefficients.h"
#include "airkit/air/constraint_divisor.h"
#include "airkit/air/evaluation_frame.h"
#include "airkit/air/transition_constraints.h"
#include "airkit/algebra/fields/base_field_element.h"
#include "airkit/composition_polynomial/periodic_column.h"

namespace airkit {

/*
  Evaluates the constraint composition polynomial of an AIR:

    C(x) = sum_i (alpha_i + beta_i * x^{k_i}) * f_i(x) / Z(x)
         + sum_j (alpha_j + beta_j * x^{k_j}) * (T_{c_j}(x) - P_j(x)) / D_j(x).

  Where:
  * f_i are the transition constraints, applied to the frame (T(x), T(g * x)) and to the periodic
    columns at x, and Z is the transition divisor.
  * T_{c_j} is the trace column of the j-th assertion, P_j its interpolated values and D_j its
    divisor.
  * (alpha, beta) are the random coefficients, and the degree adjustments k raise every term to
    Context().CompositionDegree().

  For a valid trace, C is a polynomial of degree CompositionDegree(). Otherwise it is a rational
  function, whose low degree extension has a much higher degree.

  This class is used both to evaluate C at a single point (out of the trace domain), and on entire
  cosets using optimizations improving the amortized computation time for each point.
  FieldElementT is the field of the coefficients and of the result.
*/
template <typename AirT, typename FieldElementT>
class ConstraintEvaluator {
 public:
  ConstraintEvaluator(
      const AirT& air, const ConstraintCompositionCoefficients<FieldElementT>& coefficients);

  /*
    Evaluates C at a single point, given the frame of the trace polynomials at point and at
    g * point.
  */
  FieldElementT EvalAtPoint(
      const FieldElementT& point, const EvaluationFrame<FieldElementT>& frame) const;

  /*
    Evaluates C on the coset {coset_offset * h^i}, where h generates the subgroup of size N =
    out_evaluation.size(). trace_evaluations[c][i] is the value of trace column c at the i-th point
    of the coset, so the next row of point i is at index (i + N/n) mod N.
    The coset must not intersect the trace domain. out_evaluation is in natural order.
    The evaluation is split into tasks of task_size points each.
  */
  void EvalOnCoset(
      const BaseFieldElement& coset_offset,
      gsl::span<const gsl::span<const BaseFieldElement>> trace_evaluations,
      gsl::span<FieldElementT> out_evaluation, uint64_t task_size = 256) const;

  uint64_t GetDegreeBound() const { return air_.Context().CompositionDegree() + 1; }

  const std::vector<TransitionConstraintGroup<FieldElementT>>& TransitionGroups() const {
    return transition_groups_;
  }

  const std::vector<BoundaryConstraintGroup<FieldElementT>>& BoundaryGroups() const {
    return boundary_groups_;
  }

 private:
  const AirT& air_;
  const ConstraintDivisor transition_divisor_;
  const std::vector<PeriodicColumn> periodic_columns_;
  const std::vector<TransitionConstraintGroup<FieldElementT>> transition_groups_;
  const std::vector<BoundaryConstraintGroup<FieldElementT>> boundary_groups_;
};

}  // namespace airkit

#include "airkit/composition_polynomial/constraint_evaluator.inl"

#endif  // AIRKIT_COMPOSITION_POLYNOMIAL_CONSTRAINT_EVALUATOR_H_
