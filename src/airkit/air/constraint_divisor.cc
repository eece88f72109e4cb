#include "airkit/air/constraint_divisor.h"

#include <sstream>
#include <tuple>

#include "airkit/math/math.h"

namespace airkit {

ConstraintDivisor::ConstraintDivisor(
    DivisorKind kind, uint64_t trace_length, uint64_t first_step, uint64_t stride)
    : kind_(kind),
      trace_length_(trace_length),
      first_step_(first_step),
      stride_(stride),
      numerator_offset_(BaseFieldElement::One()),
      exclusion_point_(BaseFieldElement::One()) {
  const BaseFieldElement trace_generator = GetSubGroupGenerator(trace_length_);
  if (kind_ == DivisorKind::kTransition) {
    exclusion_point_ = Pow(trace_generator, trace_length_ - 1);
  } else {
    numerator_offset_ = Pow(trace_generator, first_step_ * NumeratorDegree());
  }
}

ConstraintDivisor ConstraintDivisor::Transition(uint64_t trace_length) {
  ASSERT_RELEASE(IsPowerOfTwo(trace_length), "Trace length must be a power of 2.");
  return ConstraintDivisor(DivisorKind::kTransition, trace_length, 0, 1);
}

ConstraintDivisor ConstraintDivisor::Boundary(
    uint64_t trace_length, uint64_t first_step, uint64_t stride) {
  ASSERT_RELEASE(IsPowerOfTwo(trace_length), "Trace length must be a power of 2.");
  ASSERT_RELEASE(
      IsPowerOfTwo(stride) && stride <= trace_length,
      "Boundary divisor stride must be a power of 2 dividing the trace length.");
  ASSERT_RELEASE(
      first_step < stride, "Boundary divisor first step must be smaller than the stride.");
  return ConstraintDivisor(DivisorKind::kBoundary, trace_length, first_step, stride);
}

ConstraintDivisor ConstraintDivisor::ForAssertion(
    const Assertion& assertion, uint64_t trace_length) {
  return Boundary(trace_length, assertion.FirstStep(), assertion.Stride(trace_length));
}

std::vector<uint64_t> ConstraintDivisor::ExclusionSteps() const {
  if (kind_ == DivisorKind::kTransition) {
    return {trace_length_ - 1};
  }
  return {};
}

const BaseFieldElement& ConstraintDivisor::ExclusionPoint() const {
  ASSERT_RELEASE(kind_ == DivisorKind::kTransition, "A boundary divisor has no excluded point.");
  return exclusion_point_;
}

bool ConstraintDivisor::operator<(const ConstraintDivisor& other) const {
  return std::make_tuple(Degree(), kind_, first_step_, stride_, trace_length_) <
         std::make_tuple(
             other.Degree(), other.kind_, other.first_step_, other.stride_, other.trace_length_);
}

size_t ConstraintDivisor::Hash() const {
  size_t seed = std::hash<int>()(static_cast<int>(kind_));
  for (const uint64_t value : {trace_length_, first_step_, stride_}) {
    // Combines the hashes as in boost::hash_combine.
    seed ^= std::hash<uint64_t>()(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  }
  return seed;
}

std::string ConstraintDivisor::ToString() const {
  std::stringstream ss;
  if (kind_ == DivisorKind::kTransition) {
    ss << "(x^" << trace_length_ << " - 1) / (x - g^" << trace_length_ - 1 << ")";
  } else {
    ss << "x^" << NumeratorDegree() << " - g^" << first_step_ * NumeratorDegree();
  }
  return ss.str();
}

}  // namespace airkit
