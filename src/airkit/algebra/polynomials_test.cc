#include "airkit/algebra/polynomials.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/algebra/field_operations.h"
#include "airkit/algebra/fields/quadratic_extension_field_element.h"
#include "airkit/error_handling/test_utils.h"
#include "airkit/stl_utils/containers.h"

namespace airkit {
namespace {

using testing::HasSubstr;

TEST(Polynomials, HornerEval) {
  // 1 + 2x + 3x^2 at x = 5.
  const std::vector<BaseFieldElement> coefs{
      BaseFieldElement::FromUint(1), BaseFieldElement::FromUint(2), BaseFieldElement::FromUint(3)};
  EXPECT_EQ(BaseFieldElement::FromUint(86), HornerEval(BaseFieldElement::FromUint(5), coefs));
  const std::vector<BaseFieldElement> no_coefs;
  EXPECT_EQ(BaseFieldElement::Zero(), HornerEval(BaseFieldElement::FromUint(5), no_coefs));
}

TEST(Polynomials, HornerEvalOnExtensionPoint) {
  Prng prng(MakeByteArray<0xca, 0xfe>());
  const auto coefs = prng.RandomFieldElementVector<BaseFieldElement>(10);
  const auto x = QuadraticExtensionFieldElement::RandomElement(&prng);
  QuadraticExtensionFieldElement expected = QuadraticExtensionFieldElement::Zero();
  for (size_t i = 0; i < coefs.size(); ++i) {
    expected += Pow(x, i) * coefs[i];
  }
  EXPECT_EQ(
      expected,
      (HornerEval<QuadraticExtensionFieldElement, BaseFieldElement>(x, gsl::make_span(coefs))));
}

TEST(Polynomials, BatchHornerEval) {
  Prng prng(MakeByteArray<0x01>());
  const auto coefs = prng.RandomFieldElementVector<BaseFieldElement>(7);
  const auto points = prng.RandomFieldElementVector<BaseFieldElement>(5);
  std::vector<BaseFieldElement> outputs = BaseFieldElement::UninitializedVector(points.size());
  BatchHornerEval<BaseFieldElement, BaseFieldElement>(points, coefs, outputs);
  for (size_t i = 0; i < points.size(); ++i) {
    EXPECT_EQ(HornerEval(points[i], coefs), outputs[i]);
  }
  std::vector<BaseFieldElement> short_outputs = BaseFieldElement::UninitializedVector(2);
  EXPECT_ASSERT(
      (BatchHornerEval<BaseFieldElement, BaseFieldElement>(points, coefs, short_outputs)),
      HasSubstr("number of outputs"));
}

TEST(Polynomials, InterpolateAndEvaluateOnCoset) {
  Prng prng(MakeByteArray<0x02>());
  const size_t n = 16;
  const auto values = prng.RandomFieldElementVector<BaseFieldElement>(n);
  const BaseFieldElement offset = BaseFieldElement::Generator();
  const auto coefs = InterpolateOnCoset<BaseFieldElement>(values, offset);
  const BaseFieldElement g = GetSubGroupGenerator(n);
  for (size_t i = 0; i < n; ++i) {
    EXPECT_EQ(values[i], HornerEval(offset * Pow(g, i), coefs));
  }
  EXPECT_EQ(values, EvaluateOnCoset<BaseFieldElement>(coefs, n, offset));

  // Evaluating on a larger domain agrees with Horner.
  const auto lde = EvaluateOnCoset<BaseFieldElement>(coefs, 4 * n, BaseFieldElement::One());
  const BaseFieldElement lde_g = GetSubGroupGenerator(4 * n);
  for (size_t i = 0; i < 4 * n; ++i) {
    EXPECT_EQ(HornerEval(Pow(lde_g, i), coefs), lde[i]);
  }
}

TEST(Polynomials, InterpolateLowDegree) {
  // Values of x^2 + 1 on the subgroup of size 8 have degree 2.
  const size_t n = 8;
  const BaseFieldElement g = GetSubGroupGenerator(n);
  std::vector<BaseFieldElement> values;
  for (size_t i = 0; i < n; ++i) {
    values.push_back(Pow(g, 2 * i) + BaseFieldElement::One());
  }
  const auto coefs = InterpolateOnCoset<BaseFieldElement>(values, BaseFieldElement::One());
  EXPECT_EQ(2, PolynomialDegree<BaseFieldElement>(coefs));
  EXPECT_EQ(BaseFieldElement::One(), coefs[0]);
  EXPECT_EQ(BaseFieldElement::One(), coefs[2]);
  const std::vector<BaseFieldElement> zeros(4, BaseFieldElement::Zero());
  EXPECT_EQ(-1, PolynomialDegree<BaseFieldElement>(zeros));
}

TEST(Polynomials, InterpolateSingleValue) {
  const std::vector<BaseFieldElement> values{BaseFieldElement::FromUint(7)};
  EXPECT_EQ(values, InterpolateOnCoset<BaseFieldElement>(values, BaseFieldElement::FromUint(3)));
}

}  // namespace
}  // namespace airkit
