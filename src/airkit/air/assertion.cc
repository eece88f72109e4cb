#include "airkit/air/assertion.h"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <utility>

#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"
#include "airkit/stl_utils/containers.h"

namespace airkit {

namespace {

template <typename T>
constexpr bool kAlwaysFalse = false;

/*
  Checks the stride and first step shared by periodic and sequence assertions.
*/
void ValidateStride(uint64_t first_step, uint64_t stride, uint64_t trace_length) {
  ASSERT_RELEASE(
      IsPowerOfTwo(stride),
      "Assertion stride must be a power of 2, got " + std::to_string(stride) + ".");
  ASSERT_RELEASE(
      stride <= trace_length, "Assertion stride " + std::to_string(stride) +
                                  " does not divide the trace length " +
                                  std::to_string(trace_length) + ".");
  ASSERT_RELEASE(
      first_step < stride, "Assertion first step " + std::to_string(first_step) +
                               " must be smaller than the stride " + std::to_string(stride) +
                               ".");
}

}  // namespace

Assertion Assertion::Single(size_t column, uint64_t step, const BaseFieldElement& value) {
  return Assertion(SingleAssertion{column, step, value});
}

Assertion Assertion::Periodic(
    size_t column, uint64_t first_step, uint64_t stride, const BaseFieldElement& value) {
  return Assertion(PeriodicAssertion{column, first_step, stride, value});
}

Assertion Assertion::Sequence(
    size_t column, uint64_t first_step, uint64_t stride, std::vector<BaseFieldElement> values) {
  return Assertion(SequenceAssertion{column, first_step, stride, std::move(values)});
}

size_t Assertion::Column() const {
  return std::visit([](const auto& assertion) { return assertion.column; }, variant_);
}

uint64_t Assertion::FirstStep() const {
  return std::visit(
      [](const auto& assertion) -> uint64_t {
        using T = std::decay_t<decltype(assertion)>;
        if constexpr (std::is_same_v<T, SingleAssertion>) {
          return assertion.step;
        } else {
          return assertion.first_step;
        }
      },
      variant_);
}

uint64_t Assertion::Stride(uint64_t trace_length) const {
  return std::visit(
      [trace_length](const auto& assertion) -> uint64_t {
        using T = std::decay_t<decltype(assertion)>;
        if constexpr (std::is_same_v<T, SingleAssertion>) {
          return trace_length;
        } else {
          return assertion.stride;
        }
      },
      variant_);
}

std::vector<uint64_t> Assertion::Steps(uint64_t trace_length) const {
  const uint64_t stride = Stride(trace_length);
  std::vector<uint64_t> steps;
  steps.reserve(NumSteps(trace_length));
  for (uint64_t step = FirstStep(); step < trace_length; step += stride) {
    steps.push_back(step);
  }
  return steps;
}

BaseFieldElement Assertion::ValueAtStep(uint64_t step, uint64_t trace_length) const {
  const uint64_t stride = Stride(trace_length);
  ASSERT_RELEASE(
      step < trace_length && step >= FirstStep() && (step - FirstStep()) % stride == 0,
      "Step " + std::to_string(step) + " is not asserted by " + ToString() + ".");
  return std::visit(
      [&](const auto& assertion) -> BaseFieldElement {
        using T = std::decay_t<decltype(assertion)>;
        if constexpr (std::is_same_v<T, SequenceAssertion>) {
          return assertion.values.at((step - assertion.first_step) / stride);
        } else {
          return assertion.value;
        }
      },
      variant_);
}

void Assertion::Validate(const TraceInfo& trace_info) const {
  ASSERT_RELEASE(
      Column() < trace_info.Width(), "Assertion column " + std::to_string(Column()) +
                                         " is out of range for a trace of width " +
                                         std::to_string(trace_info.Width()) + ".");
  std::visit(
      [&trace_info](const auto& assertion) {
        using T = std::decay_t<decltype(assertion)>;
        const uint64_t trace_length = trace_info.Length();
        if constexpr (std::is_same_v<T, SingleAssertion>) {
          ASSERT_RELEASE(
              assertion.step < trace_length,
              "Assertion step " + std::to_string(assertion.step) +
                  " is out of range for a trace of length " + std::to_string(trace_length) + ".");
        } else if constexpr (std::is_same_v<T, PeriodicAssertion>) {
          ValidateStride(assertion.first_step, assertion.stride, trace_length);
        } else if constexpr (std::is_same_v<T, SequenceAssertion>) {
          ValidateStride(assertion.first_step, assertion.stride, trace_length);
          const uint64_t expected_size = trace_length / assertion.stride;
          ASSERT_RELEASE(
              assertion.values.size() == expected_size,
              "A sequence assertion with stride " + std::to_string(assertion.stride) +
                  " over a trace of length " + std::to_string(trace_length) + " must have " +
                  std::to_string(expected_size) + " values, got " +
                  std::to_string(assertion.values.size()) + ".");
        } else {
          static_assert(kAlwaysFalse<T>, "Unhandled assertion type.");
        }
      },
      variant_);
}

bool Assertion::OverlapsWith(const Assertion& other, uint64_t trace_length) const {
  if (Column() != other.Column()) {
    return false;
  }
  const uint64_t stride = std::min(Stride(trace_length), other.Stride(trace_length));
  return FirstStep() % stride == other.FirstStep() % stride;
}

bool Assertion::operator==(const Assertion& other) const {
  if (variant_.index() != other.variant_.index()) {
    return false;
  }
  return std::visit(
      [&other](const auto& assertion) {
        using T = std::decay_t<decltype(assertion)>;
        const T& rhs = std::get<T>(other.variant_);
        if constexpr (std::is_same_v<T, SingleAssertion>) {
          return assertion.column == rhs.column && assertion.step == rhs.step &&
                 assertion.value == rhs.value;
        } else if constexpr (std::is_same_v<T, PeriodicAssertion>) {
          return assertion.column == rhs.column && assertion.first_step == rhs.first_step &&
                 assertion.stride == rhs.stride && assertion.value == rhs.value;
        } else {
          return assertion.column == rhs.column && assertion.first_step == rhs.first_step &&
                 assertion.stride == rhs.stride && assertion.values == rhs.values;
        }
      },
      variant_);
}

std::string Assertion::ToString() const {
  std::stringstream ss;
  std::visit(
      [&ss](const auto& assertion) {
        using T = std::decay_t<decltype(assertion)>;
        if constexpr (std::is_same_v<T, SingleAssertion>) {
          ss << "Single(column: " << assertion.column << ", step: " << assertion.step
             << ", value: " << assertion.value << ")";
        } else if constexpr (std::is_same_v<T, PeriodicAssertion>) {
          ss << "Periodic(column: " << assertion.column
             << ", first_step: " << assertion.first_step << ", stride: " << assertion.stride
             << ", value: " << assertion.value << ")";
        } else {
          ss << "Sequence(column: " << assertion.column
             << ", first_step: " << assertion.first_step << ", stride: " << assertion.stride
             << ", values: " << assertion.values << ")";
        }
      },
      variant_);
  return ss.str();
}

std::vector<Assertion> NormalizeAssertions(
    const std::vector<Assertion>& assertions, const TraceInfo& trace_info) {
  const uint64_t trace_length = trace_info.Length();
  std::vector<Assertion> kept;
  for (const Assertion& assertion : assertions) {
    assertion.Validate(trace_info);
    bool is_redundant = false;
    std::vector<bool> is_covered(kept.size(), false);
    for (size_t i = 0; i < kept.size(); ++i) {
      if (!assertion.OverlapsWith(kept[i], trace_length)) {
        continue;
      }
      const bool kept_is_denser = kept[i].Stride(trace_length) <= assertion.Stride(trace_length);
      const Assertion& sparse = kept_is_denser ? assertion : kept[i];
      const Assertion& dense = kept_is_denser ? kept[i] : assertion;
      for (const uint64_t step : sparse.Steps(trace_length)) {
        ASSERT_RELEASE(
            sparse.ValueAtStep(step, trace_length) == dense.ValueAtStep(step, trace_length),
            "Conflicting assertions: " + kept[i].ToString() + " and " + assertion.ToString() +
                " assert different values at step " + std::to_string(step) + ".");
      }
      if (kept_is_denser) {
        is_redundant = true;
      } else {
        is_covered[i] = true;
      }
    }

    std::vector<Assertion> remaining;
    remaining.reserve(kept.size() + 1);
    for (size_t i = 0; i < kept.size(); ++i) {
      if (!is_covered[i]) {
        remaining.push_back(std::move(kept[i]));
      }
    }
    if (!is_redundant) {
      remaining.push_back(assertion);
    }
    kept = std::move(remaining);
  }
  return kept;
}

}  // namespace airkit
