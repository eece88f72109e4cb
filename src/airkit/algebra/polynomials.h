#ifndef AIRKIT_ALGEBRA_POLYNOMIALS_H_
#define AIRKIT_ALGEBRA_POLYNOMIALS_H_

#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  Evaluates the polynomial with the given coefficients (lowest degree first) at a point x.
  FieldElementPoints must be FieldElementCoefs or an extension of it.
*/
template <typename FieldElementPoints, typename FieldElementCoefs = FieldElementPoints>
FieldElementPoints HornerEval(
    const FieldElementPoints& x, gsl::span<const FieldElementCoefs> coefs);

template <typename FieldElementT>
FieldElementT HornerEval(const FieldElementT& x, const std::vector<FieldElementT>& coefs) {
  return HornerEval<FieldElementT, FieldElementT>(x, gsl::make_span(coefs));
}

/*
  Same as HornerEval(), but for many points.
*/
template <typename FieldElementPoints, typename FieldElementCoefs>
void BatchHornerEval(
    gsl::span<const FieldElementPoints> points, gsl::span<const FieldElementCoefs> coefs,
    gsl::span<FieldElementPoints> outputs);

/*
  Returns the coefficients of the unique polynomial P of degree < values.size() with
  P(offset * g^i) = values[i], where g generates the subgroup of size values.size().
  values.size() must be a power of 2.
*/
template <typename FieldElementT>
std::vector<FieldElementT> InterpolateOnCoset(
    gsl::span<const FieldElementT> values, const BaseFieldElement& offset);

/*
  Returns {P(offset * g^i)} for i in [0, domain_size), where g generates the subgroup of size
  domain_size. domain_size must be a power of 2 not smaller than coefs.size().
*/
template <typename FieldElementT>
std::vector<FieldElementT> EvaluateOnCoset(
    gsl::span<const FieldElementT> coefs, size_t domain_size, const BaseFieldElement& offset);

/*
  Returns the degree of the polynomial with the given coefficients, or -1 for the zero polynomial.
*/
template <typename FieldElementT>
int64_t PolynomialDegree(gsl::span<const FieldElementT> coefs);

}  // namespace airkit

#include "airkit/algebra/polynomials.inl"

#endif  // AIRKIT_ALGEBRA_POLYNOMIALS_H_
