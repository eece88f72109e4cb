#ifndef AIRKIT_AIR_TRANSITION_CONSTRAINT_DEGREE_H_
#define AIRKIT_AIR_TRANSITION_CONSTRAINT_DEGREE_H_

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace airkit {

/*
  Describes the degree of a transition constraint, in units of the trace polynomials degree.

  base_degree is the number of trace values multiplied together in the constraint (trace columns
  are of degree 1). Every periodic column multiplied into the constraint adds its cycle length to
  cycles. A periodic column with cycle length c is a polynomial of degree (n / c) * (c - 1) over a
  trace of length n, which is a little less than a trace column, and is counted as 1 when
  computing the blowup factor.

  For example, the constraint next[0] - current[0]^3 - k(x), where k is a periodic column with a
  cycle of 32 steps, has TransitionConstraintDegree(3, {32}).
*/
class TransitionConstraintDegree {
 public:
  static constexpr size_t kMaxBaseDegree = 16;

  explicit TransitionConstraintDegree(size_t base_degree)
      : TransitionConstraintDegree(base_degree, {}) {}

  TransitionConstraintDegree(size_t base_degree, std::vector<uint64_t> cycles);

  size_t BaseDegree() const { return base_degree_; }
  const std::vector<uint64_t>& Cycles() const { return cycles_; }

  /*
    The degree of the constraint relative to the trace degree, rounding every periodic column up
    to 1.
  */
  size_t MaxDegree() const { return base_degree_ + cycles_.size(); }

  /*
    The smallest blowup of the trace domain on which the constraint can be evaluated, i.e. the
    smallest power of 2 that is not smaller than MaxDegree().
  */
  uint64_t MinBlowupFactor() const;

  /*
    Returns the exact degree of the constraint polynomial when the trace polynomials are of degree
    trace_length - 1:
      base_degree * (trace_length - 1) + sum_i (trace_length / cycles[i]) * (cycles[i] - 1).
    Every cycle must divide trace_length.
  */
  uint64_t EvaluationDegree(uint64_t trace_length) const;

  bool operator==(const TransitionConstraintDegree& other) const {
    return base_degree_ == other.base_degree_ && cycles_ == other.cycles_;
  }
  bool operator!=(const TransitionConstraintDegree& other) const { return !(*this == other); }

  std::string ToString() const;

 private:
  size_t base_degree_;
  std::vector<uint64_t> cycles_;
};

inline std::ostream& operator<<(std::ostream& out, const TransitionConstraintDegree& degree) {
  return out << degree.ToString();
}

}  // namespace airkit

#endif  // AIRKIT_AIR_TRANSITION_CONSTRAINT_DEGREE_H_
