#ifndef AIRKIT_AIR_ASSERTION_H_
#define AIRKIT_AIR_ASSERTION_H_

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "airkit/air/trace_info.h"
#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  The value in the given column at the given step equals value.
*/
struct SingleAssertion {
  size_t column;
  uint64_t step;
  BaseFieldElement value;
};

/*
  The value in the given column equals value at steps first_step, first_step + stride,
  first_step + 2 * stride, ...
*/
struct PeriodicAssertion {
  size_t column;
  uint64_t first_step;
  uint64_t stride;
  BaseFieldElement value;
};

/*
  The value in the given column equals values[i] at step first_step + i * stride.
*/
struct SequenceAssertion {
  size_t column;
  uint64_t first_step;
  uint64_t stride;
  std::vector<BaseFieldElement> values;
};

using AssertionVariant = std::variant<SingleAssertion, PeriodicAssertion, SequenceAssertion>;

/*
  A claim about the values of some cells of the trace. Assertions tie the public input to the
  trace, and are turned into boundary constraints.

  The asserted steps of a periodic or sequence assertion cover the whole trace: there are exactly
  trace_length / stride of them, so first_step must be smaller than stride. A single assertion
  behaves like a periodic one with stride equal to the trace length.
*/
class Assertion {
 public:
  static Assertion Single(size_t column, uint64_t step, const BaseFieldElement& value);
  static Assertion Periodic(
      size_t column, uint64_t first_step, uint64_t stride, const BaseFieldElement& value);
  static Assertion Sequence(
      size_t column, uint64_t first_step, uint64_t stride, std::vector<BaseFieldElement> values);

  const AssertionVariant& Variant() const { return variant_; }

  bool IsSingle() const { return std::holds_alternative<SingleAssertion>(variant_); }
  bool IsPeriodic() const { return std::holds_alternative<PeriodicAssertion>(variant_); }
  bool IsSequence() const { return std::holds_alternative<SequenceAssertion>(variant_); }

  size_t Column() const;
  uint64_t FirstStep() const;

  /*
    Returns the distance between two consecutive asserted steps. A single assertion has one step,
    and its stride is trace_length.
  */
  uint64_t Stride(uint64_t trace_length) const;

  uint64_t NumSteps(uint64_t trace_length) const {
    return trace_length / Stride(trace_length);
  }

  std::vector<uint64_t> Steps(uint64_t trace_length) const;

  /*
    Returns the asserted value at step, which must be one of Steps(trace_length).
  */
  BaseFieldElement ValueAtStep(uint64_t step, uint64_t trace_length) const;

  /*
    Checks the assertion against the shape of the trace.
  */
  void Validate(const TraceInfo& trace_info) const;

  /*
    Returns true if the two assertions constrain at least one common cell. Both must be valid for
    a trace of length trace_length.
    Since strides are powers of 2, the steps of the sparser assertion are then all steps of the
    denser one.
  */
  bool OverlapsWith(const Assertion& other, uint64_t trace_length) const;

  bool operator==(const Assertion& other) const;
  bool operator!=(const Assertion& other) const { return !(*this == other); }

  std::string ToString() const;

 private:
  explicit Assertion(AssertionVariant variant) : variant_(std::move(variant)) {}

  AssertionVariant variant_;
};

inline std::ostream& operator<<(std::ostream& out, const Assertion& assertion) {
  return out << assertion.ToString();
}

/*
  Validates assertions against the trace and removes redundancy:
  - Two assertions on the same cell with different values raise "Conflicting assertions".
  - An assertion whose cells are all asserted by another assertion with the same values is
    dropped. The denser assertion is kept; for assertions on the same steps, the first one is
    kept.
  The remaining assertions are returned in the order in which they were given.
*/
std::vector<Assertion> NormalizeAssertions(
    const std::vector<Assertion>& assertions, const TraceInfo& trace_info);

}  // namespace airkit

#endif  // AIRKIT_AIR_ASSERTION_H_
