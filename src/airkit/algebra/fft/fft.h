#ifndef AIRKIT_ALGEBRA_FFT_FFT_H_
#define AIRKIT_ALGEBRA_FFT_FFT_H_

#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  Evaluates the polynomial with coefficients src (natural order, lowest degree first) on the coset
  {offset * generator^i}, writing dst[i] = P(offset * generator^i).
  generator must generate a subgroup of size src.size(), which must be a power of 2.
  FieldElementT may be BaseFieldElement or an extension of it.
*/
template <typename FieldElementT>
void Fft(
    gsl::span<const FieldElementT> src, gsl::span<FieldElementT> dst,
    const BaseFieldElement& generator, const BaseFieldElement& offset);

/*
  The inverse of Fft(): given src[i] = P(offset * generator^i), writes the coefficients of P
  (degree < src.size()) to dst. The output is normalized.
*/
template <typename FieldElementT>
void Ifft(
    gsl::span<const FieldElementT> src, gsl::span<FieldElementT> dst,
    const BaseFieldElement& generator, const BaseFieldElement& offset);

}  // namespace airkit

#include "airkit/algebra/fft/fft.inl"

#endif  // AIRKIT_ALGEBRA_FFT_FFT_H_
