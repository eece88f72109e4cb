#include "airkit/algebra/fft/fft.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/algebra/field_operations.h"
#include "airkit/algebra/fields/cubic_extension_field_element.h"
#include "airkit/algebra/polynomials.h"
#include "airkit/error_handling/test_utils.h"
#include "airkit/stl_utils/containers.h"

namespace airkit {
namespace {

using testing::HasSubstr;

template <typename T>
class FftTest : public ::testing::Test {};

using FieldTypes = ::testing::Types<BaseFieldElement, CubicExtensionFieldElement>;
TYPED_TEST_CASE(FftTest, FieldTypes);

TYPED_TEST(FftTest, FftMatchesHorner) {
  Prng prng(MakeByteArray<0xca, 0xfe>());
  const size_t n = 32;
  const auto coefs = prng.RandomFieldElementVector<TypeParam>(n);
  const BaseFieldElement g = GetSubGroupGenerator(n);
  const BaseFieldElement offset = BaseFieldElement::RandomElement(&prng);
  std::vector<TypeParam> evals = TypeParam::UninitializedVector(n);
  Fft<TypeParam>(coefs, evals, g, offset);
  for (size_t i = 0; i < n; ++i) {
    const TypeParam point = TypeParam::FromBaseField(offset * Pow(g, i));
    EXPECT_EQ(HornerEval(point, coefs), evals[i]);
  }
}

TYPED_TEST(FftTest, IfftInvertsFft) {
  Prng prng(MakeByteArray<0x01, 0x02>());
  const size_t n = 64;
  const auto coefs = prng.RandomFieldElementVector<TypeParam>(n);
  const BaseFieldElement g = GetSubGroupGenerator(n);
  const BaseFieldElement offset = BaseFieldElement::Generator();
  std::vector<TypeParam> evals = TypeParam::UninitializedVector(n);
  std::vector<TypeParam> result = TypeParam::UninitializedVector(n);
  Fft<TypeParam>(coefs, evals, g, offset);
  Ifft<TypeParam>(evals, result, g, offset);
  EXPECT_EQ(coefs, result);
}

TEST(Fft, WrongGenerator) {
  const std::vector<BaseFieldElement> coefs(8, BaseFieldElement::One());
  std::vector<BaseFieldElement> evals = BaseFieldElement::UninitializedVector(8);
  EXPECT_ASSERT(
      Fft<BaseFieldElement>(coefs, evals, GetSubGroupGenerator(16), BaseFieldElement::One()),
      HasSubstr("generator does not match"));
}

}  // namespace
}  // namespace airkit
