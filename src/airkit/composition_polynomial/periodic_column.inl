#include "airkit/algebra/field_operations.h"
#include "airkit/algebra/polynomials.h"

namespace airkit {

template <typename FieldElementT>
FieldElementT PeriodicColumn::EvalAtPoint(const FieldElementT& x) const {
  const FieldElementT point = Pow(x, trace_length_ / period_);
  return HornerEval<FieldElementT, BaseFieldElement>(point, coefs_);
}

}  // namespace airkit
