/*
  Implements an AIR for the claim:
    "Counting up from start for n - 1 steps reaches end",
  i.e. a trace of a single column with T[i + 1] = T[i] + 1, T[0] = start and T[n - 1] = end.
*/
#ifndef AIRKIT_AIR_INCREMENT_INCREMENT_AIR_H_
#define AIRKIT_AIR_INCREMENT_INCREMENT_AIR_H_

#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/air.h"
#include "airkit/air/trace.h"
#include "airkit/utils/json.h"

namespace airkit {

class IncrementAir : public Air {
 public:
  static constexpr size_t kNumColumns = 1;
  static constexpr size_t kNumAssertions = 2;

  struct PublicInputs {
    BaseFieldElement start;
    BaseFieldElement end;

    /*
      Reads {"start": "0x1", "end": "0x10"}.
    */
    static PublicInputs FromJson(const JsonValue& json);
    JsonValue ToJson() const;

    /*
      The public inputs of the trace of the given length starting at start.
    */
    static PublicInputs Compute(const BaseFieldElement& start, uint64_t trace_length);
  };

  IncrementAir(
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

#include "airkit/air/increment/increment_air.inl"

#endif  // AIRKIT_AIR_INCREMENT_INCREMENT_AIR_H_
