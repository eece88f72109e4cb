#include <array>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/algebra/field_operations.h"
#include "airkit/algebra/fields/cubic_extension_field_element.h"
#include "airkit/algebra/fields/quadratic_extension_field_element.h"
#include "airkit/error_handling/test_utils.h"
#include "airkit/stl_utils/containers.h"

namespace airkit {
namespace {

using testing::HasSubstr;

BaseFieldElement Fe(uint64_t val) { return BaseFieldElement::FromUint(val); }

template <typename T>
class ExtensionFieldTest : public ::testing::Test {};

using ExtensionFieldTypes =
    ::testing::Types<QuadraticExtensionFieldElement, CubicExtensionFieldElement>;
TYPED_TEST_CASE(ExtensionFieldTest, ExtensionFieldTypes);

TYPED_TEST(ExtensionFieldTest, FieldAxioms) {
  Prng prng(MakeByteArray<0xca, 0xfe, 0xca, 0xfe>());
  const auto a = TypeParam::RandomElement(&prng);
  const auto b = TypeParam::RandomElement(&prng);
  const auto c = TypeParam::RandomElement(&prng);
  EXPECT_EQ(a * (b + c), a * b + a * c);
  EXPECT_EQ((a * b) * c, a * (b * c));
  EXPECT_EQ(a * b, b * a);
  EXPECT_EQ(TypeParam::One(), a * a.Inverse());
  EXPECT_EQ(a, (a / b) * b);
  EXPECT_EQ(TypeParam::Zero(), a - a);
  EXPECT_EQ(a + a, a * TypeParam::FromUint(2));
}

TYPED_TEST(ExtensionFieldTest, MixedBaseFieldOperations) {
  Prng prng(MakeByteArray<0x01, 0x02>());
  const auto a = TypeParam::RandomElement(&prng);
  const auto b = BaseFieldElement::RandomElement(&prng);
  EXPECT_EQ(a * TypeParam::FromBaseField(b), a * b);
  EXPECT_EQ(a * b, b * a);
  EXPECT_EQ(a + TypeParam::FromBaseField(b), a + b);
  EXPECT_EQ(TypeParam::FromBaseField(b) - a, b - a);
  EXPECT_TRUE(TypeParam::FromBaseField(b).IsInBaseField());
  EXPECT_FALSE(a.IsInBaseField());
}

TYPED_TEST(ExtensionFieldTest, InverseOfZero) {
  EXPECT_ASSERT(TypeParam::Zero().Inverse(), HasSubstr("Zero does not have an inverse"));
}

TYPED_TEST(ExtensionFieldTest, StringAndBytes) {
  Prng prng(MakeByteArray<0x03>());
  const auto a = TypeParam::RandomElement(&prng);
  EXPECT_EQ(a, TypeParam::FromString(a.ToString()));
  EXPECT_EQ(TypeParam::FromUint(0x17), TypeParam::FromString("0x17"));
  std::array<std::byte, TypeParam::SizeInBytes()> bytes{};
  a.ToBytes(bytes);
  EXPECT_EQ(a, TypeParam::FromBytes(bytes));
}

TYPED_TEST(ExtensionFieldTest, PowMatchesMultiplication) {
  Prng prng(MakeByteArray<0x04>());
  const auto a = TypeParam::RandomElement(&prng);
  EXPECT_EQ(a * a * a * a * a, Pow(a, 5));
  EXPECT_EQ(TypeParam::One(), Pow(a, 0));
}

// Expected values were computed with python over F[X]/(X^2 - X - 1).
TEST(QuadraticExtensionFieldElement, KnownValues) {
  const QuadraticExtensionFieldElement a(Fe(467630292337398741), Fe(906471533792748794));
  const QuadraticExtensionFieldElement b(Fe(12345), Fe(67890));
  EXPECT_EQ(
      QuadraticExtensionFieldElement(Fe(1969953309154747453), Fe(1799786868690248345)), a * b);
  EXPECT_EQ(
      QuadraticExtensionFieldElement(Fe(2894753023229832341), Fe(485264857139217996)),
      a.Inverse());
  const QuadraticExtensionFieldElement phi(BaseFieldElement::Zero(), BaseFieldElement::One());
  EXPECT_EQ(phi + QuadraticExtensionFieldElement::One(), phi * phi);
}

// Expected values were computed with python over F[X]/(X^3 - X - 2).
TEST(CubicExtensionFieldElement, KnownValues) {
  const CubicExtensionFieldElement a(
      Fe(467630292337398741), Fe(906471533792748794), Fe(1872395317058213941));
  const CubicExtensionFieldElement b(Fe(12345), Fe(67890), Fe(1357911));
  EXPECT_EQ(
      CubicExtensionFieldElement(
          Fe(4100594182087117197), Fe(2535053242343128737), Fe(2628808847049208525)),
      a * b);
  EXPECT_EQ(
      CubicExtensionFieldElement(
          Fe(3626838163285279524), Fe(3707501773169935423), Fe(996071968373984055)),
      a.Inverse());
  const CubicExtensionFieldElement phi(
      BaseFieldElement::Zero(), BaseFieldElement::One(), BaseFieldElement::Zero());
  EXPECT_EQ(phi + CubicExtensionFieldElement::FromUint(2), phi * phi * phi);
}

TEST(CubicExtensionFieldElement, FrobeniusHasOrderThree) {
  Prng prng(MakeByteArray<0x05>());
  const auto a = CubicExtensionFieldElement::RandomElement(&prng);
  EXPECT_NE(a, a.GetFrobenius());
  EXPECT_EQ(a, a.GetFrobenius().GetFrobenius().GetFrobenius());
  const auto b = CubicExtensionFieldElement::RandomElement(&prng);
  EXPECT_EQ((a * b).GetFrobenius(), a.GetFrobenius() * b.GetFrobenius());
}

TEST(QuadraticExtensionFieldElement, BadFormat) {
  EXPECT_ASSERT(
      QuadraticExtensionFieldElement::FromString("0x1::0x2::0x3"), HasSubstr("Bad"));
}

}  // namespace
}  // namespace airkit
