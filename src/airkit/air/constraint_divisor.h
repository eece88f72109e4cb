#ifndef AIRKIT_AIR_CONSTRAINT_DIVISOR_H_
#define AIRKIT_AIR_CONSTRAINT_DIVISOR_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "airkit/air/assertion.h"
#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

enum class DivisorKind { kTransition, kBoundary };

/*
  The polynomial a constraint must be divisible by, i.e. the polynomial whose roots are the trace
  domain points on which the constraint holds. Let g be the trace generator and n the trace
  length:
  - Transition: (x^n - 1) / (x - g^(n - 1)). Vanishes on every step except the last one, which
    has no next row. Degree n - 1.
  - Boundary(first_step, stride): x^m - g^(first_step * m), where m = n / stride. Vanishes
    exactly on the steps first_step, first_step + stride, ... Degree m. A single step is the
    boundary divisor with stride n, i.e. x - g^first_step.

  Divisors are compared by value: two divisors built from the same parameters are equal, so
  constraints can be grouped by divisor.
*/
class ConstraintDivisor {
 public:
  static ConstraintDivisor Transition(uint64_t trace_length);
  static ConstraintDivisor Boundary(uint64_t trace_length, uint64_t first_step, uint64_t stride);

  /*
    The divisor vanishing on the steps of the given (valid) assertion.
  */
  static ConstraintDivisor ForAssertion(const Assertion& assertion, uint64_t trace_length);

  DivisorKind Kind() const { return kind_; }
  uint64_t TraceLength() const { return trace_length_; }
  uint64_t FirstStep() const { return first_step_; }
  uint64_t Stride() const { return stride_; }

  /*
    The number of trace steps on which the divisor vanishes.
  */
  uint64_t Degree() const { return NumeratorDegree() - ExclusionSteps().size(); }

  /*
    The degree of x^n - 1 (transition) or x^m - c (boundary).
  */
  uint64_t NumeratorDegree() const { return trace_length_ / stride_; }

  /*
    The steps removed from the vanishing set of the numerator.
  */
  std::vector<uint64_t> ExclusionSteps() const;

  /*
    The divisor is (x^NumeratorDegree() - NumeratorOffset()) / (x - ExclusionPoint()). Boundary
    divisors have no denominator, and ExclusionPoint() fails on them.
  */
  const BaseFieldElement& NumeratorOffset() const { return numerator_offset_; }
  const BaseFieldElement& ExclusionPoint() const;

  /*
    Evaluates the divisor at x. At the excluded point of a transition divisor, returns the value
    of the quotient polynomial there, n * g.
    FieldElementT may be BaseFieldElement or an extension of it.
  */
  template <typename FieldElementT>
  FieldElementT EvaluateAt(const FieldElementT& x) const;

  bool operator==(const ConstraintDivisor& other) const {
    return kind_ == other.kind_ && trace_length_ == other.trace_length_ &&
           first_step_ == other.first_step_ && stride_ == other.stride_;
  }
  bool operator!=(const ConstraintDivisor& other) const { return !(*this == other); }

  /*
    Orders divisors by degree, then by kind, first step and stride.
  */
  bool operator<(const ConstraintDivisor& other) const;

  size_t Hash() const;

  std::string ToString() const;

 private:
  ConstraintDivisor(
      DivisorKind kind, uint64_t trace_length, uint64_t first_step, uint64_t stride);

  DivisorKind kind_;
  uint64_t trace_length_;
  uint64_t first_step_;
  uint64_t stride_;
  // The free coefficient of the numerator, x^NumeratorDegree() - numerator_offset_.
  BaseFieldElement numerator_offset_;
  // The root of the denominator (transition only).
  BaseFieldElement exclusion_point_;
};

inline std::ostream& operator<<(std::ostream& out, const ConstraintDivisor& divisor) {
  return out << divisor.ToString();
}

}  // namespace airkit

namespace std {  // NOLINT: modifying std is discouraged by clang-tidy.

template <>
struct hash<airkit::ConstraintDivisor> {
  size_t operator()(const airkit::ConstraintDivisor& divisor) const { return divisor.Hash(); }
};

}  // namespace std

#include "airkit/air/constraint_divisor.inl"

#endif  // AIRKIT_AIR_CONSTRAINT_DIVISOR_H_
