#include "airkit/randomness/prng.h"

#include <array>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/algebra/fields/base_field_element.h"
#include "airkit/stl_utils/containers.h"

namespace airkit {
namespace {

using Bytes = std::array<std::byte, 40>;

Bytes ReadBytes(Prng* prng) {
  Bytes bytes{};
  prng->GetRandomBytes(bytes);
  return bytes;
}

TEST(PrngTest, SameSeedYieldsSameStream) {
  Prng prng1(MakeByteArray<1, 2, 3, 4, 5>());
  Prng prng2(MakeByteArray<1, 2, 3, 4, 5>());
  EXPECT_EQ(ReadBytes(&prng1), ReadBytes(&prng2));
  EXPECT_EQ(
      prng1.RandomFieldElementVector<BaseFieldElement>(10),
      prng2.RandomFieldElementVector<BaseFieldElement>(10));
}

TEST(PrngTest, StreamAdvances) {
  Prng prng(MakeByteArray<0xca, 0xfe, 0xca, 0xfe>());
  EXPECT_NE(ReadBytes(&prng), ReadBytes(&prng));
  const std::vector<BaseFieldElement> elements = prng.RandomFieldElementVector<BaseFieldElement>(2);
  EXPECT_NE(elements[0], elements[1]);
}

TEST(PrngTest, MixSeedChangesStream) {
  Prng prng1(MakeByteArray<0xca, 0xfe>());
  Prng prng2(MakeByteArray<0xca, 0xfe>());
  prng2.MixSeedWithBytes(MakeByteArray<0x00>());
  EXPECT_NE(ReadBytes(&prng1), ReadBytes(&prng2));
}

TEST(PrngTest, MixSeedRestartsTheStream) {
  // The state after mixing depends only on the previous state and the mixed bytes, not on how much
  // of the stream was read.
  Prng prng1(MakeByteArray<0x12, 0x34>());
  Prng prng2(MakeByteArray<0x12, 0x34>());
  ReadBytes(&prng1);
  prng1.MixSeedWithBytes(MakeByteArray<0x56>());
  prng2.MixSeedWithBytes(MakeByteArray<0x56>());
  EXPECT_EQ(ReadBytes(&prng1), ReadBytes(&prng2));
}

TEST(PrngTest, OverrideSeedFlag) {
  FLAGS_override_random_seed = "0x1234";
  Prng prng1;
  Prng prng2;
  FLAGS_override_random_seed = "";
  EXPECT_EQ(ReadBytes(&prng1), ReadBytes(&prng2));
  Prng prng3(MakeByteArray<0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x12, 0x34>());
  EXPECT_EQ(ReadBytes(&prng3), ReadBytes(&prng1));
}

}  // namespace
}  // namespace airkit
