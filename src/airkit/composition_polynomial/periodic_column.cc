#include "airkit/composition_polynomial/periodic_column.h"

#include <string>

#include "airkit/algebra/field_operations.h"
#include "airkit/algebra/polynomials.h"

namespace airkit {

namespace {

uint64_t ValidatedPeriod(gsl::span<const BaseFieldElement> values, uint64_t trace_length) {
  ASSERT_RELEASE(IsPowerOfTwo(trace_length), "The trace length must be a power of 2.");
  ASSERT_RELEASE(
      IsPowerOfTwo(values.size()) && values.size() <= trace_length,
      "A periodic column has " + std::to_string(values.size()) +
          " values; the number of values must be a power of 2 dividing the trace length.");
  return values.size();
}

}  // namespace

PeriodicColumn::PeriodicColumn(gsl::span<const BaseFieldElement> values, uint64_t trace_length)
    : values_(values.begin(), values.end()),
      period_(ValidatedPeriod(values, trace_length)),
      trace_length_(trace_length),
      coefs_(InterpolateOnCoset<BaseFieldElement>(values, BaseFieldElement::One())) {}

auto PeriodicColumn::GetCoset(const BaseFieldElement& offset, const uint64_t coset_size) const
    -> CosetEvaluation {
  ASSERT_RELEASE(
      IsPowerOfTwo(coset_size) && coset_size >= trace_length_,
      "The coset size must be a power of 2 not smaller than the trace length.");
  const uint64_t n_copies = trace_length_ / period_;
  // x -> x^{n/c} maps the coset of size N onto a coset of size N / (n/c).
  return CosetEvaluation(EvaluateOnCoset<BaseFieldElement>(
      coefs_, coset_size / n_copies, Pow(offset, n_copies)));
}

}  // namespace airkit
