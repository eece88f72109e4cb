#ifndef AIRKIT_AIR_COEFFICIENTS_H_
#define AIRKIT_AIR_COEFFICIENTS_H_

#include <utility>
#include <vector>

namespace airkit {

/*
  Random coefficients for the composition polynomial: one (alpha, beta) pair per transition
  constraint and one per boundary constraint. alpha multiplies the constraint quotient and beta
  multiplies the quotient shifted by x^k, its degree adjustment.
*/
template <typename FieldElementT>
struct ConstraintCompositionCoefficients {
  std::vector<std::pair<FieldElementT, FieldElementT>> transition;
  std::vector<std::pair<FieldElementT, FieldElementT>> boundary;
};

/*
  Random coefficients for the DEEP composition polynomial:
  - trace: one pair per trace column, for the out of domain evaluations at z and g * z.
  - composition: one pair per composition polynomial column.
  - degree: the pair raising the combination to the degree of the low degree test.
*/
template <typename FieldElementT>
struct DeepCompositionCoefficients {
  std::vector<std::pair<FieldElementT, FieldElementT>> trace;
  std::vector<std::pair<FieldElementT, FieldElementT>> composition;
  std::pair<FieldElementT, FieldElementT> degree;
};

}  // namespace airkit

#endif  // AIRKIT_AIR_COEFFICIENTS_H_
