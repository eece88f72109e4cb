#ifndef AIRKIT_ALGEBRA_FIELD_OPERATIONS_H_
#define AIRKIT_ALGEBRA_FIELD_OPERATIONS_H_

#include <string>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/algebra/fields/base_field_element.h"
#include "airkit/error_handling/error_handling.h"

namespace airkit {

using std::size_t;
using std::uint64_t;

/*
  Returns base^exp. Negative exponents are not supported.
*/
template <typename FieldElementT>
FieldElementT Pow(const FieldElementT& base, __uint128_t exp) {
  FieldElementT power = base;
  FieldElementT res = FieldElementT::One();
  while (exp != 0) {
    if ((exp & 1) == 1) {
      res *= power;
    }
    power *= power;
    exp >>= 1;
  }
  return res;
}

/*
  Returns a generator of the multiplicative subgroup of size n.
  n must be a power of 2 not exceeding 2^BaseFieldElement::kTwoAdicity.
*/
inline BaseFieldElement GetSubGroupGenerator(uint64_t n) {
  ASSERT_RELEASE(IsPowerOfTwo(n), "Subgroup size must be a power of 2.");
  ASSERT_RELEASE(
      n <= Pow2(BaseFieldElement::kTwoAdicity),
      "The field has no multiplicative subgroup of size " + std::to_string(n) + ".");
  const uint64_t quotient = SafeDiv(BaseFieldElement::FieldSize() - 1, n);
  return Pow(BaseFieldElement::Generator(), quotient);
}

/*
  Replaces every element of values by its inverse, using a single field inversion
  (Montgomery's batch inversion). All values must be non-zero.
*/
template <typename FieldElementT>
void BatchInverseInPlace(gsl::span<FieldElementT> values) {
  if (values.empty()) {
    return;
  }
  std::vector<FieldElementT> prefix_products = FieldElementT::UninitializedVector(values.size());
  prefix_products[0] = values[0];
  for (size_t i = 1; i < values.size(); ++i) {
    prefix_products[i] = prefix_products[i - 1] * values[i];
  }
  ASSERT_RELEASE(
      prefix_products.back() != FieldElementT::Zero(), "Cannot invert a batch containing zero.");
  FieldElementT inverse = prefix_products.back().Inverse();
  for (size_t i = values.size() - 1; i > 0; --i) {
    const FieldElementT value = values[i];
    values[i] = inverse * prefix_products[i - 1];
    inverse *= value;
  }
  values[0] = inverse;
}

}  // namespace airkit

#endif  // AIRKIT_ALGEBRA_FIELD_OPERATIONS_H_
