#ifndef AIRKIT_RANDOMNESS_HASH_CHAIN_H_
#define AIRKIT_RANDOMNESS_HASH_CHAIN_H_

#include <array>
#include <cstddef>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/crypt_tools/blake2s.h"

namespace airkit {

/*
  A stream of pseudo random bytes derived from a Blake2s256 state.
  Output block i is Hash(state || 0..0 || BigEndian64(i)); bytes left over from a block are consumed
  by the next request. Mixing new bytes into the chain replaces the state and restarts the stream.
*/
class HashChain {
 public:
  explicit HashChain(gsl::span<const std::byte> seed);

  void GetRandomBytes(gsl::span<std::byte> random_bytes_out);

  /*
    Sets the state to Hash(state || raw_bytes).
  */
  void UpdateHashChain(gsl::span<const std::byte> raw_bytes);

  const Blake2s256& GetHashChainState() const { return hash_; }

 private:
  static Blake2s256 HashWithCounter(const Blake2s256& hash, uint64_t counter);

  void ResetStream();

  Blake2s256 hash_;
  // Unread bytes of the last generated block are spare_bytes_[spare_offset_..].
  std::array<std::byte, Blake2s256::kDigestNumBytes> spare_bytes_{};
  size_t spare_offset_ = Blake2s256::kDigestNumBytes;
  uint64_t counter_ = 0;
};

}  // namespace airkit

#endif  // AIRKIT_RANDOMNESS_HASH_CHAIN_H_
