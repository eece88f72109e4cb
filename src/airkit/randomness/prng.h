#ifndef AIRKIT_RANDOMNESS_PRNG_H_
#define AIRKIT_RANDOMNESS_PRNG_H_

#include <cstddef>
#include <vector>

#include "gflags/gflags.h"
#include "gsl/gsl-lite.hpp"

#include "airkit/randomness/hash_chain.h"

DECLARE_string(override_random_seed);

namespace airkit {

/*
  Pseudo Random Number Generator. Deterministic given its seed.

  Note: This class is not thread safe.
*/
class Prng {
 public:
  /*
    Seeds from the system time, or from --override_random_seed when it is set.
  */
  Prng();
  ~Prng() = default;

  // Copies would produce correlated randomness.
  Prng(const Prng&) = delete;
  Prng& operator=(const Prng&) = delete;
  Prng(Prng&& src) = default;
  Prng& operator=(Prng&& other) = default;

  explicit Prng(gsl::span<const std::byte> bytes) : hash_chain_(bytes) {}

  template <typename FieldElementT>
  std::vector<FieldElementT> RandomFieldElementVector(size_t n_elements) {
    std::vector<FieldElementT> return_vec;
    return_vec.reserve(n_elements);
    for (size_t i = 0; i < n_elements; ++i) {
      return_vec.push_back(FieldElementT::RandomElement(this));
    }
    return return_vec;
  }

  void GetRandomBytes(gsl::span<std::byte> random_bytes_out) {
    hash_chain_.GetRandomBytes(random_bytes_out);
  }

  /*
    Mixes new bytes into the seed. The output stream restarts from the new state.
  */
  void MixSeedWithBytes(gsl::span<const std::byte> raw_bytes) {
    hash_chain_.UpdateHashChain(raw_bytes);
  }

 private:
  HashChain hash_chain_;
};

}  // namespace airkit

#endif  // AIRKIT_RANDOMNESS_PRNG_H_
