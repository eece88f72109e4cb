#include "airkit/air/periodic_counter/periodic_counter_air.h"

#include <memory>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/air/air_test_utils.h"
#include "airkit/air/trace_validation.h"
#include "airkit/error_handling/test_utils.h"
#include "airkit/randomness/prng.h"

namespace airkit {
namespace {

using testing::HasSubstr;

const ProofParameters kParameters(32, 4, 0, FieldExtension::kNone, HashFunction::kBlake2s256);

std::unique_ptr<PeriodicCounterAir> MakeAir(uint64_t trace_length, uint64_t cycle_length) {
  return BuildAir<PeriodicCounterAir>(
      TraceInfo(PeriodicCounterAir::kNumColumns, trace_length),
      {cycle_length, BaseFieldElement::FromUint(100)}, kParameters);
}

TEST(PeriodicCounterAir, Assertions) {
  const auto air = MakeAir(32, 8);
  const std::vector<Assertion> assertions = air->GetAssertions();
  ASSERT_EQ(3U, assertions.size());
  EXPECT_EQ(Assertion::Periodic(0, 0, 8, BaseFieldElement::Zero()), assertions[0]);
  EXPECT_EQ(Assertion::Single(0, 7, BaseFieldElement::FromUint(7)), assertions[1]);
  EXPECT_EQ(
      Assertion::Sequence(
          1, 0, 8,
          {BaseFieldElement::FromUint(100), BaseFieldElement::FromUint(128),
           BaseFieldElement::FromUint(156), BaseFieldElement::FromUint(184)}),
      assertions[2]);
  EXPECT_EQ(3U, air->NumBoundaryConstraints());
}

TEST(PeriodicCounterAir, Context) {
  const auto air = MakeAir(32, 8);
  EXPECT_EQ(2U, air->Context().MaxConstraintDegree());
  EXPECT_EQ(2U, air->Context().CeBlowupFactor());
  EXPECT_EQ(63U, air->Context().CompositionDegree());
  const auto periodic_columns = air->GetPeriodicColumnValues();
  ASSERT_EQ(1U, periodic_columns.size());
  EXPECT_EQ(BaseFieldElement::One(), periodic_columns[0][6]);
  EXPECT_EQ(BaseFieldElement::Zero(), periodic_columns[0][7]);
}

TEST(PeriodicCounterAir, InvalidCycleLength) {
  EXPECT_ASSERT(MakeAir(32, 6), HasSubstr("power of 2"));
  EXPECT_ASSERT(MakeAir(32, 64), HasSubstr("exceeds the trace length"));
}

TEST(PeriodicCounterAir, GeneratedTraceIsValid) {
  for (const uint64_t cycle_length : {2, 8, 32}) {
    const auto air = MakeAir(32, cycle_length);
    const Trace trace = air->GetTrace();
    EXPECT_NO_THROW(ValidateTrace(*air, trace)) << "cycle_length: " << cycle_length;
  }
}

TEST(PeriodicCounterAir, MissedResetViolatesTheMaskedConstraint) {
  const auto air = MakeAir(32, 8);
  Trace trace = air->GetTrace();
  // The counter continues to 8 instead of restarting.
  trace.SetTraceElementForTesting(0, 8, BaseFieldElement::FromUint(8));
  const auto violation = FindTraceViolation(*air, trace);
  ASSERT_TRUE(violation.has_value());
  // The periodic assertion is checked first.
  EXPECT_EQ(ViolationKind::kAssertion, violation->kind);
  EXPECT_EQ(0U, violation->index);
  EXPECT_EQ(8U, violation->step);
}

TEST(PeriodicCounterAir, WrongSum) {
  const auto air = MakeAir(32, 8);
  Trace trace = air->GetTrace();
  trace.SetTraceElementForTesting(1, 20, trace.At(1, 20) + BaseFieldElement::One());
  const auto violation = FindTraceViolation(*air, trace);
  ASSERT_TRUE(violation.has_value());
  EXPECT_EQ(ViolationKind::kTransition, violation->kind);
  EXPECT_EQ(1U, violation->index);
  EXPECT_EQ(19U, violation->step);
}

TEST(PeriodicCounterAir, CompositionDegree) {
  Prng prng;
  const auto air = MakeAir(64, 8);
  const auto coefficients = RandomCompositionCoefficients<BaseFieldElement>(*air, &prng);
  Trace trace = air->GetTrace();
  EXPECT_EQ(
      static_cast<int64_t>(air->Context().CompositionDegree()),
      ComputeCompositionDegree(*air, trace, coefficients));

  trace.SetTraceElementForTesting(1, 16, trace.At(1, 16) + BaseFieldElement::One());
  EXPECT_LT(
      static_cast<int64_t>(air->Context().CompositionDegree()),
      ComputeCompositionDegree(*air, trace, coefficients));
}

}  // namespace
}  // namespace airkit
