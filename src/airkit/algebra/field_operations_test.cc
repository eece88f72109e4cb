#include "airkit/algebra/field_operations.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/algebra/fields/cubic_extension_field_element.h"
#include "airkit/error_handling/test_utils.h"
#include "airkit/stl_utils/containers.h"

namespace airkit {
namespace {

using testing::HasSubstr;

TEST(FieldOperations, Pow) {
  const auto x = BaseFieldElement::FromUint(3);
  EXPECT_EQ(BaseFieldElement::One(), Pow(x, 0));
  EXPECT_EQ(BaseFieldElement::FromUint(243), Pow(x, 5));
  // Fermat's little theorem.
  EXPECT_EQ(x, Pow(x, BaseFieldElement::kModulus));
}

TEST(FieldOperations, GetSubGroupGenerator) {
  for (size_t log_n : {0, 1, 3, 10, 39}) {
    const uint64_t n = Pow2(log_n);
    const BaseFieldElement g = GetSubGroupGenerator(n);
    EXPECT_EQ(BaseFieldElement::One(), Pow(g, n));
    if (n > 1) {
      EXPECT_EQ(-BaseFieldElement::One(), Pow(g, n / 2));
    }
  }
  EXPECT_ASSERT(GetSubGroupGenerator(12), HasSubstr("must be a power of 2"));
  EXPECT_ASSERT(GetSubGroupGenerator(Pow2(40)), HasSubstr("has no multiplicative subgroup"));
}

TEST(FieldOperations, GeneratorHasFullOrder) {
  const BaseFieldElement g = BaseFieldElement::Generator();
  for (uint64_t factor : BaseFieldElement::PrimeFactors()) {
    EXPECT_NE(BaseFieldElement::One(), Pow(g, (BaseFieldElement::kModulus - 1) / factor));
  }
}

BaseFieldElement RandomNonZeroElement(Prng* prng) {
  BaseFieldElement x = BaseFieldElement::RandomElement(prng);
  while (x == BaseFieldElement::Zero()) {
    x = BaseFieldElement::RandomElement(prng);
  }
  return x;
}

TEST(FieldOperations, BatchInverse) {
  Prng prng(MakeByteArray<0xbe, 0xef>());
  std::vector<BaseFieldElement> values;
  for (size_t i = 0; i < 10; ++i) {
    values.push_back(RandomNonZeroElement(&prng));
  }
  std::vector<BaseFieldElement> inverses = values;
  BatchInverseInPlace<BaseFieldElement>(inverses);
  for (size_t i = 0; i < values.size(); ++i) {
    EXPECT_EQ(values[i].Inverse(), inverses[i]);
  }
  std::vector<BaseFieldElement> with_zero{BaseFieldElement::One(), BaseFieldElement::Zero()};
  EXPECT_ASSERT(
      BatchInverseInPlace<BaseFieldElement>(with_zero), HasSubstr("batch containing zero"));
}

}  // namespace
}  // namespace airkit
