#include "airkit/air/air_context.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/algebra/field_operations.h"
#include "airkit/error_handling/test_utils.h"

namespace airkit {
namespace {

using testing::HasSubstr;

ProofParameters TestParameters(uint64_t blowup_factor) {
  return ProofParameters(
      32, blowup_factor, 0, FieldExtension::kNone, HashFunction::kBlake2s256);
}

TEST(AirContext, DerivedQuantities) {
  const AirContext context(
      TraceInfo(2, 64), {TransitionConstraintDegree(3), TransitionConstraintDegree(1, {8})}, 2,
      TestParameters(8));
  EXPECT_EQ(2U, context.TraceWidth());
  EXPECT_EQ(64U, context.TraceLength());
  EXPECT_EQ(63U, context.TracePolyDegree());
  EXPECT_EQ(2U, context.NumTransitionConstraints());
  EXPECT_EQ(2U, context.NumAssertions());
  EXPECT_EQ(3U, context.MaxConstraintDegree());
  EXPECT_EQ(4U, context.CeBlowupFactor());
  EXPECT_EQ(256U, context.CeDomainSize());
  EXPECT_EQ(255U, context.CompositionDegree());
  EXPECT_EQ(4U, context.NumCompositionColumns());
  EXPECT_EQ(8U, context.BlowupFactor());
  EXPECT_EQ(512U, context.LdeDomainSize());
}

TEST(AirContext, Generators) {
  const AirContext context(
      TraceInfo(1, 16), {TransitionConstraintDegree(2)}, 1, TestParameters(4));
  const BaseFieldElement& g = context.TraceGenerator();
  EXPECT_EQ(BaseFieldElement::One(), Pow(g, 16));
  EXPECT_NE(BaseFieldElement::One(), Pow(g, 8));
  const BaseFieldElement& h = context.LdeDomainGenerator();
  EXPECT_EQ(BaseFieldElement::One(), Pow(h, 64));
  EXPECT_NE(BaseFieldElement::One(), Pow(h, 32));
  // The trace domain is a subgroup of the LDE domain subgroup.
  EXPECT_EQ(g, Pow(h, 4));
  // The offset is not in the subgroup, so the LDE coset is disjoint from the trace domain.
  EXPECT_NE(BaseFieldElement::One(), Pow(AirContext::DomainOffset(), 64));
}

TEST(AirContext, BlowupFactorBoundary) {
  for (size_t base_degree = 1; base_degree <= 8; ++base_degree) {
    const uint64_t min_blowup = TransitionConstraintDegree(base_degree).MinBlowupFactor();
    for (uint64_t blowup = 2; blowup <= 16; blowup *= 2) {
      const auto build = [&]() {
        return AirContext(
            TraceInfo(1, 32), {TransitionConstraintDegree(base_degree)}, 1,
            TestParameters(blowup));
      };
      if (blowup >= min_blowup) {
        EXPECT_NO_THROW(build());
      } else {
        EXPECT_ASSERT(build(), HasSubstr("blowup factor"));
      }
    }
  }
}

TEST(AirContext, DegreeFourNeedsBlowupFour) {
  EXPECT_ASSERT(
      AirContext(TraceInfo(1, 8), {TransitionConstraintDegree(4)}, 1, TestParameters(2)),
      HasSubstr("The blowup factor 2 is smaller than the minimum blowup factor 4"));
  EXPECT_NO_THROW(
      AirContext(TraceInfo(1, 8), {TransitionConstraintDegree(4)}, 1, TestParameters(4)));
}

TEST(AirContext, PeriodicColumnsCountTowardsTheDegree) {
  EXPECT_ASSERT(
      AirContext(TraceInfo(1, 32), {TransitionConstraintDegree(2, {4})}, 1, TestParameters(2)),
      HasSubstr("blowup factor"));
  EXPECT_ASSERT(
      AirContext(TraceInfo(1, 32), {TransitionConstraintDegree(1, {64})}, 1, TestParameters(2)),
      HasSubstr("exceeds the trace length"));
}

TEST(AirContext, ConfigurationErrors) {
  EXPECT_ASSERT(
      AirContext(TraceInfo(1, 8), {TransitionConstraintDegree(1)}, 0, TestParameters(2)),
      HasSubstr("at least one assertion"));
  EXPECT_ASSERT(
      AirContext(TraceInfo(1, 8), {}, 1, TestParameters(2)),
      HasSubstr("at least one transition constraint"));
}

}  // namespace
}  // namespace airkit
