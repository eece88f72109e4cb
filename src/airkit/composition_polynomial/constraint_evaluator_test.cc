#include "airkit/composition_polynomial/constraint_evaluator.h"

#include <memory>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/air/air_test_utils.h"
#include "airkit/air/periodic_counter/periodic_counter_air.h"
#include "airkit/algebra/field_operations.h"
#include "airkit/algebra/fields/quadratic_extension_field_element.h"
#include "airkit/algebra/polynomials.h"
#include "airkit/error_handling/test_utils.h"
#include "airkit/randomness/prng.h"

namespace airkit {
namespace {

using testing::HasSubstr;

using ExtensionT = QuadraticExtensionFieldElement;
using EvaluatorT = ConstraintEvaluator<PeriodicCounterAir, ExtensionT>;

constexpr uint64_t kTraceLength = 32;

class ConstraintEvaluatorTest : public ::testing::Test {
 public:
  ConstraintEvaluatorTest()
      : air_(BuildAir<PeriodicCounterAir>(
            TraceInfo(PeriodicCounterAir::kNumColumns, kTraceLength),
            {8, BaseFieldElement::FromUint(7)},
            ProofParameters(32, 4, 0, FieldExtension::kQuadratic, HashFunction::kBlake2s256))),
        coefficients_(RandomCompositionCoefficients<ExtensionT>(*air_, &prng_)),
        evaluator_(*air_, coefficients_) {
    const Trace trace = air_->GetTrace();
    for (size_t i = 0; i < trace.Width(); ++i) {
      trace_coefs_.push_back(
          InterpolateOnCoset<BaseFieldElement>(trace.GetColumn(i), BaseFieldElement::One()));
    }
  }

 protected:
  /*
    Evaluates the trace polynomials on the coset of the given size with offset
    AirContext::DomainOffset().
  */
  std::vector<std::vector<BaseFieldElement>> TraceOnCoset(uint64_t coset_size) const {
    std::vector<std::vector<BaseFieldElement>> evaluations;
    for (const auto& coefs : trace_coefs_) {
      evaluations.push_back(
          EvaluateOnCoset<BaseFieldElement>(coefs, coset_size, AirContext::DomainOffset()));
    }
    return evaluations;
  }

  EvaluationFrame<ExtensionT> FrameAt(
      const ExtensionT& point, std::vector<ExtensionT>* current, std::vector<ExtensionT>* next) {
    const ExtensionT shifted_point = point * GetSubGroupGenerator(kTraceLength);
    current->clear();
    next->clear();
    for (const auto& coefs : trace_coefs_) {
      current->push_back(HornerEval<ExtensionT, BaseFieldElement>(point, coefs));
      next->push_back(HornerEval<ExtensionT, BaseFieldElement>(shifted_point, coefs));
    }
    return EvaluationFrame<ExtensionT>(*current, *next);
  }

  Prng prng_;
  std::unique_ptr<PeriodicCounterAir> air_;
  ConstraintCompositionCoefficients<ExtensionT> coefficients_;
  EvaluatorT evaluator_;
  std::vector<std::vector<BaseFieldElement>> trace_coefs_;
};

TEST_F(ConstraintEvaluatorTest, Groups) {
  EXPECT_EQ(64U, evaluator_.GetDegreeBound());
  // Degrees 31 and 31 + 4 * 7.
  ASSERT_EQ(2U, evaluator_.TransitionGroups().size());
  EXPECT_EQ(31U, evaluator_.TransitionGroups()[0].EvaluationDegree());
  EXPECT_EQ(59U, evaluator_.TransitionGroups()[1].EvaluationDegree());
  EXPECT_EQ(3U, evaluator_.BoundaryGroups().size());
}

/*
  Every value of EvalOnCoset() is the value of EvalAtPoint() on the same point, with the frame
  taken from the coset evaluation of the trace.
*/
TEST_F(ConstraintEvaluatorTest, EvalOnCosetMatchesEvalAtPoint) {
  for (const uint64_t coset_size : {32, 128}) {
    const auto trace_evaluations = TraceOnCoset(coset_size);
    const std::vector<gsl::span<const BaseFieldElement>> trace_spans(
        trace_evaluations.begin(), trace_evaluations.end());
    std::vector<ExtensionT> evaluation = ExtensionT::UninitializedVector(coset_size);
    // A task size that does not divide the coset size.
    evaluator_.EvalOnCoset(AirContext::DomainOffset(), trace_spans, evaluation, 5);

    const BaseFieldElement generator = GetSubGroupGenerator(coset_size);
    const uint64_t next_row_shift = coset_size / kTraceLength;
    BaseFieldElement point = AirContext::DomainOffset();
    for (uint64_t i = 0; i < coset_size; ++i) {
      std::vector<ExtensionT> current;
      std::vector<ExtensionT> next;
      const uint64_t next_idx = (i + next_row_shift) % coset_size;
      for (const auto& column : trace_evaluations) {
        current.push_back(ExtensionT::FromBaseField(column[i]));
        next.push_back(ExtensionT::FromBaseField(column[next_idx]));
      }
      EXPECT_EQ(
          evaluator_.EvalAtPoint(
              ExtensionT::FromBaseField(point), EvaluationFrame<ExtensionT>(current, next)),
          evaluation[i])
          << "coset_size: " << coset_size << ", index: " << i;
      point *= generator;
    }
  }
}

/*
  For a valid trace the composition is a polynomial of degree < GetDegreeBound(), so it can be
  recovered from its values on a coset of that size and evaluated anywhere.
*/
TEST_F(ConstraintEvaluatorTest, OutOfDomainPoint) {
  const uint64_t coset_size = evaluator_.GetDegreeBound();
  const auto trace_evaluations = TraceOnCoset(coset_size);
  std::vector<ExtensionT> evaluation = ExtensionT::UninitializedVector(coset_size);
  evaluator_.EvalOnCoset(
      AirContext::DomainOffset(),
      std::vector<gsl::span<const BaseFieldElement>>(
          trace_evaluations.begin(), trace_evaluations.end()),
      evaluation);
  const std::vector<ExtensionT> composition_coefs =
      InterpolateOnCoset<ExtensionT>(evaluation, AirContext::DomainOffset());

  const ExtensionT z = ExtensionT::RandomElement(&prng_);
  std::vector<ExtensionT> current;
  std::vector<ExtensionT> next;
  EXPECT_EQ(
      HornerEval(z, composition_coefs), evaluator_.EvalAtPoint(z, FrameAt(z, &current, &next)));
}

TEST_F(ConstraintEvaluatorTest, InvalidInput) {
  std::vector<ExtensionT> current;
  std::vector<ExtensionT> next;
  const ExtensionT trace_point =
      ExtensionT::FromBaseField(Pow(GetSubGroupGenerator(kTraceLength), 3));
  EXPECT_ASSERT(
      evaluator_.EvalAtPoint(trace_point, FrameAt(trace_point, &current, &next)),
      HasSubstr("on the trace domain"));

  const std::vector<ExtensionT> narrow_row{ExtensionT::One()};
  EXPECT_ASSERT(
      evaluator_.EvalAtPoint(
          ExtensionT::RandomElement(&prng_), EvaluationFrame<ExtensionT>(narrow_row, narrow_row)),
      HasSubstr("frame width"));

  const auto small_coset = TraceOnCoset(16);
  std::vector<ExtensionT> evaluation = ExtensionT::UninitializedVector(16);
  EXPECT_ASSERT(
      evaluator_.EvalOnCoset(
          AirContext::DomainOffset(),
          std::vector<gsl::span<const BaseFieldElement>>(small_coset.begin(), small_coset.end()),
          evaluation),
      HasSubstr("not smaller than the trace length"));

  const auto coset = TraceOnCoset(64);
  evaluation = ExtensionT::UninitializedVector(64);
  EXPECT_ASSERT(
      evaluator_.EvalOnCoset(
          AirContext::DomainOffset(), std::vector<gsl::span<const BaseFieldElement>>{coset[0]},
          evaluation),
      HasSubstr("Expected evaluations of 2 trace columns, got 1."));
}

}  // namespace
}  // namespace airkit
