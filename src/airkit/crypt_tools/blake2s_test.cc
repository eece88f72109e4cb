#include "airkit/crypt_tools/blake2s.h"

#include <array>
#include <sstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/stl_utils/containers.h"

namespace airkit {
namespace {

const std::array<std::byte, 12> kHelloWorld =
    MakeByteArray<'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'>();

// Expected values were obtained using python3's hashlib.blake2s(b'Hello World!', digest_size=d).
TEST(Blake2s, HelloWorld256) {
  const Blake2s256 hash = Blake2s256::HashBytesWithLength(kHelloWorld);
  std::stringstream ss;
  ss << hash;
  EXPECT_EQ("0xbe8c6777e88d287dd927975327dd4214d199a1a1b67fe2e26666cc336533666a", ss.str());
}

TEST(Blake2s, ShortDigest) {
  const Blake2s<20> hash = Blake2s<20>::HashBytesWithLength(kHelloWorld);
  EXPECT_EQ("0xe6076197dab4e568b725421a4356e191f4ac13ab", hash.ToString());
}

TEST(Blake2s, EmptyInput) {
  EXPECT_EQ(
      "0x69217a3079908094e11121d042354a7c1f55b6482ca1a51e1b250dfd1ed0eef9",
      Blake2s256::HashBytesWithLength({}).ToString());
}

TEST(Blake2s, Equality) {
  const Blake2s256 hash = Blake2s256::HashBytesWithLength(kHelloWorld);
  EXPECT_EQ(hash, Blake2s256::HashBytesWithLength(kHelloWorld));
  EXPECT_NE(hash, Blake2s256::HashBytesWithLength(gsl::make_span(kHelloWorld).first(11)));
}

}  // namespace
}  // namespace airkit
