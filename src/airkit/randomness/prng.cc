#include "airkit/randomness/prng.h"

#include <array>
#include <chrono>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "airkit/utils/serialization.h"
#include "airkit/utils/to_from_string.h"

DEFINE_string(override_random_seed, "", "Hex seed (e.g. 0x1234) for the default Prng.");

namespace airkit {

namespace {

std::array<std::byte, sizeof(uint64_t)> SeedFromSystemTime() {
  const uint64_t seed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
  std::array<std::byte, sizeof(uint64_t)> seed_bytes{};
  Serialize(seed, seed_bytes);
  return seed_bytes;
}

std::array<std::byte, sizeof(uint64_t)> SeedFromHexString(const std::string& hex) {
  std::array<std::byte, sizeof(uint64_t)> seed_bytes{};
  HexStringToBytes(hex, seed_bytes);
  return seed_bytes;
}

std::array<std::byte, sizeof(uint64_t)> DefaultSeed() {
  const std::array<std::byte, sizeof(uint64_t)> seed_bytes =
      FLAGS_override_random_seed.empty() ? SeedFromSystemTime()
                                         : SeedFromHexString(FLAGS_override_random_seed);
  // Logged so that a failing run can be reproduced with --override_random_seed.
  LOG(INFO) << "Seeding PRNG with " << BytesToHexString(seed_bytes) << ".";
  return seed_bytes;
}

}  // namespace

Prng::Prng() : hash_chain_(DefaultSeed()) {}

}  // namespace airkit
