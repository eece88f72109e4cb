#ifndef AIRKIT_AIR_COEFFICIENT_GENERATOR_H_
#define AIRKIT_AIR_COEFFICIENT_GENERATOR_H_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/coefficients.h"
#include "airkit/randomness/prng.h"

namespace airkit {

/*
  Derives the random coefficients of the composition and DEEP composition polynomials from a
  public random seed (supplied by the public coin), so that the prover and the verifier compute
  the same coefficients.

  Every request starts from a fresh Prng over the seed, into which a tag of the coefficient family
  and the requested counts are mixed. Hence identical seeds and counts yield identical
  coefficients, a change in any count changes all of them, and the two families are
  independent. Both families take the constraint counts, so the DEEP coefficients also change
  with the set of constraints.
*/
class CoefficientGenerator {
 public:
  explicit CoefficientGenerator(gsl::span<const std::byte> public_seed)
      : public_seed_(public_seed.begin(), public_seed.end()) {}

  template <typename FieldElementT>
  ConstraintCompositionCoefficients<FieldElementT> GetConstraintCompositionCoefficients(
      size_t num_transition_constraints, size_t num_boundary_constraints) const;

  template <typename FieldElementT>
  DeepCompositionCoefficients<FieldElementT> GetDeepCompositionCoefficients(
      size_t num_transition_constraints, size_t num_boundary_constraints, size_t trace_width,
      size_t num_composition_columns) const;

  const std::vector<std::byte>& PublicSeed() const { return public_seed_; }

 private:
  /*
    Returns a Prng over the public seed, mixed with the tag and counts.
  */
  Prng MakePrng(const std::string& tag, gsl::span<const uint64_t> counts) const;

  template <typename FieldElementT>
  static std::vector<std::pair<FieldElementT, FieldElementT>> DrawPairs(Prng* prng, size_t n);

  std::vector<std::byte> public_seed_;
};

}  // namespace airkit

#include "airkit/air/coefficient_generator.inl"

#endif  // AIRKIT_AIR_COEFFICIENT_GENERATOR_H_
