/*
  Implements an AIR for the claim:
    "The 2n-th element of the Fibonacci sequence 1, 1, 2, 3, 5, ... is result".

  The trace has two columns, and each row holds two consecutive elements of the sequence:
  row i is (F_{2i+1}, F_{2i+2}). The transition constraints are
    next[0] = current[0] + current[1],
    next[1] = current[1] + next[0].
*/
#ifndef AIRKIT_AIR_FIBONACCI_FIBONACCI_AIR_H_
#define AIRKIT_AIR_FIBONACCI_FIBONACCI_AIR_H_

#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/air.h"
#include "airkit/air/trace.h"
#include "airkit/utils/json.h"

namespace airkit {

class FibonacciAir : public Air {
 public:
  static constexpr size_t kNumColumns = 2;
  static constexpr size_t kNumConstraints = 2;
  static constexpr size_t kNumAssertions = 3;

  struct PublicInputs {
    BaseFieldElement result;

    static PublicInputs FromJson(const JsonValue& json);
    JsonValue ToJson() const;

    /*
      Computes the 2n-th element of the sequence, for a trace of length n.
    */
    static PublicInputs Compute(uint64_t trace_length);
  };

  FibonacciAir(
      const TraceInfo& trace_info, const PublicInputs& public_inputs,
      const ProofParameters& proof_parameters);

  std::vector<Assertion> GetAssertions() const override;

  template <typename FieldElementT>
  void EvaluateTransition(
      const EvaluationFrame<FieldElementT>& frame, gsl::span<const FieldElementT> periodic_values,
      gsl::span<FieldElementT> result) const;

  Trace GetTrace() const;

 private:
  const PublicInputs public_inputs_;
};

}  // namespace airkit

#include "airkit/air/fibonacci/fibonacci_air.inl"

#endif  // AIRKIT_AIR_FIBONACCI_FIBONACCI_AIR_H_
