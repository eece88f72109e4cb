#include "airkit/algebra/field_operations.h"

namespace airkit {

template <typename FieldElementT>
FieldElementT ConstraintDivisor::EvaluateAt(const FieldElementT& x) const {
  const FieldElementT numerator =
      Pow(x, NumeratorDegree()) - FieldElementT::FromBaseField(numerator_offset_);
  if (kind_ == DivisorKind::kBoundary) {
    return numerator;
  }
  const FieldElementT denominator = x - FieldElementT::FromBaseField(exclusion_point_);
  if (denominator == FieldElementT::Zero()) {
    // The excluded point is a simple root of the numerator, so the quotient there equals the
    // derivative of the numerator, n * x^(n-1).
    return FieldElementT::FromBaseField(BaseFieldElement::FromUint(NumeratorDegree())) *
           Pow(x, NumeratorDegree() - 1);
  }
  return numerator / denominator;
}

}  // namespace airkit
