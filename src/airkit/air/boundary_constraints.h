#ifndef AIRKIT_AIR_BOUNDARY_CONSTRAINTS_H_
#define AIRKIT_AIR_BOUNDARY_CONSTRAINTS_H_

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/air_context.h"
#include "airkit/air/assertion.h"
#include "airkit/air/constraint_divisor.h"
#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  The boundary constraint induced by an assertion on one column:
    (T(x) - P(x)) / D(x),
  where T is the trace column polynomial, D is the divisor of the assertion, and P is the
  polynomial of degree < deg(D) that takes the asserted values on the roots of D (a constant for
  single and periodic assertions).
  FieldElementT is the field of the random coefficients.
*/
template <typename FieldElementT>
class BoundaryConstraint {
 public:
  BoundaryConstraint(
      const Assertion& assertion, uint64_t trace_length,
      const std::pair<FieldElementT, FieldElementT>& coefficients);

  size_t Column() const { return column_; }

  /*
    The coefficients of P, lowest degree first.
  */
  const std::vector<BaseFieldElement>& PolyCoefs() const { return poly_coefs_; }

  const std::pair<FieldElementT, FieldElementT>& Coefficients() const { return coefficients_; }

  /*
    Returns T(x) - P(x), given trace_value = T(x).
  */
  FieldElementT EvaluateNumerator(const FieldElementT& x, const FieldElementT& trace_value) const;

 private:
  size_t column_;
  std::vector<BaseFieldElement> poly_coefs_;
  std::pair<FieldElementT, FieldElementT> coefficients_;
};

/*
  The boundary constraints sharing a divisor D. Their contribution to the composition polynomial
  is
    sum_i (alpha_i + beta_i * x^k) * (T_i(x) - P_i(x)) / D(x),
  where k = DegreeAdjustment() raises each term to the composition degree:
  deg(T_i - P_i) - deg(D) + k = (n - 1) - deg(D) + k = CompositionDegree().
  Constraints are ordered by column.
*/
template <typename FieldElementT>
class BoundaryConstraintGroup {
 public:
  BoundaryConstraintGroup(const ConstraintDivisor& divisor, const AirContext& context);

  /*
    Adds a constraint. Its divisor must be Divisor().
  */
  void AddConstraint(BoundaryConstraint<FieldElementT> constraint);

  const ConstraintDivisor& Divisor() const { return divisor_; }
  uint64_t DegreeAdjustment() const { return degree_adjustment_; }
  const std::vector<BoundaryConstraint<FieldElementT>>& Constraints() const {
    return constraints_;
  }

  /*
    Returns the sum of the numerators, each multiplied by its (alpha + beta * x^k), given
    x_pow_adjustment = x^k and the values of the trace columns at x.
  */
  FieldElementT MergeNumerators(
      const FieldElementT& x, gsl::span<const FieldElementT> trace_row,
      const FieldElementT& x_pow_adjustment) const;

  /*
    Returns the contribution of the group to the composition polynomial at x.
  */
  FieldElementT EvaluateAt(const FieldElementT& x, gsl::span<const FieldElementT> trace_row) const;

 private:
  ConstraintDivisor divisor_;
  uint64_t degree_adjustment_;
  std::vector<BoundaryConstraint<FieldElementT>> constraints_;
};

/*
  Turns normalized assertions (see NormalizeAssertions()) into boundary constraint groups, one per
  divisor. Groups are ordered by their divisor (increasing degree first), and constraints inside a
  group by column. coefficients[i] is assigned to the i-th constraint in this order, so there must
  be one pair per assertion.
*/
template <typename FieldElementT>
std::vector<BoundaryConstraintGroup<FieldElementT>> BuildBoundaryConstraintGroups(
    const std::vector<Assertion>& assertions, const AirContext& context,
    gsl::span<const std::pair<FieldElementT, FieldElementT>> coefficients);

}  // namespace airkit

#include "airkit/air/boundary_constraints.inl"

#endif  // AIRKIT_AIR_BOUNDARY_CONSTRAINTS_H_
