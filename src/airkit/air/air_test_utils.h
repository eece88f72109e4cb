#ifndef AIRKIT_AIR_AIR_TEST_UTILS_H_
#define AIRKIT_AIR_AIR_TEST_UTILS_H_

#include <cstddef>
#include <cstdint>

#include "airkit/air/air.h"
#include "airkit/air/coefficients.h"
#include "airkit/air/trace.h"
#include "airkit/randomness/prng.h"

namespace airkit {

/*
  Draws random composition coefficients for air: one pair per transition constraint and one per
  normalized assertion.
*/
template <typename FieldElementT>
ConstraintCompositionCoefficients<FieldElementT> RandomCompositionCoefficients(
    const Air& air, Prng* prng);

/*
  Returns the degree of the constraint composition polynomial of air on the given trace, with the
  given coefficients. Used for air-constraints unit testing.
  The trace is interpolated and evaluated on a coset of size num_of_cosets times the composition
  domain size, the constraints are applied there, and the result is interpolated back. For a valid
  trace the result is air.Context().CompositionDegree(). Otherwise the constraint quotients are not
  polynomials, and the result is (with high probability) larger.
*/
template <typename AirT, typename FieldElementT>
int64_t ComputeCompositionDegree(
    const AirT& air, const Trace& trace,
    const ConstraintCompositionCoefficients<FieldElementT>& coefficients,
    size_t num_of_cosets = 2);

}  // namespace airkit

#include "airkit/air/air_test_utils.inl"

#endif  // AIRKIT_AIR_AIR_TEST_UTILS_H_
