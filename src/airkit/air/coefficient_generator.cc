#include "airkit/air/coefficient_generator.h"

#include "airkit/utils/serialization.h"

namespace airkit {

Prng CoefficientGenerator::MakePrng(
    const std::string& tag, gsl::span<const uint64_t> counts) const {
  Prng prng(public_seed_);
  std::vector<std::byte> bytes;
  bytes.reserve(tag.size() + counts.size() * sizeof(uint64_t));
  for (const char c : tag) {
    bytes.push_back(static_cast<std::byte>(c));
  }
  for (const uint64_t count : counts) {
    AppendSerialized(count, &bytes);
  }
  prng.MixSeedWithBytes(bytes);
  return prng;
}

}  // namespace airkit
