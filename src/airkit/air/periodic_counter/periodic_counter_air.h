/*
  Implements an AIR for a counter that restarts every cycle_length steps, and an accumulator of
  its values:
    counter[i + 1] = (counter[i] + 1) * mask(i),
    sum[i + 1] = sum[i] + counter[i],
  where mask is a periodic column which is 0 on the last step of every cycle and 1 elsewhere.

  The assertions are:
  * The counter is 0 at the start of every cycle (periodic assertion).
  * The counter is cycle_length - 1 at the end of the first cycle (single assertion).
  * The sum at the start of cycle j is initial + j * cycle_length * (cycle_length - 1) / 2
    (sequence assertion).
*/
#ifndef AIRKIT_AIR_PERIODIC_COUNTER_PERIODIC_COUNTER_AIR_H_
#define AIRKIT_AIR_PERIODIC_COUNTER_PERIODIC_COUNTER_AIR_H_

#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/air.h"
#include "airkit/air/trace.h"
#include "airkit/utils/json.h"

namespace airkit {

class PeriodicCounterAir : public Air {
 public:
  static constexpr size_t kNumColumns = 2;
  static constexpr size_t kNumConstraints = 2;
  static constexpr size_t kNumAssertions = 3;

  struct PublicInputs {
    uint64_t cycle_length;
    BaseFieldElement initial;

    static PublicInputs FromJson(const JsonValue& json);
    JsonValue ToJson() const;
  };

  PeriodicCounterAir(
      const TraceInfo& trace_info, const PublicInputs& public_inputs,
      const ProofParameters& proof_parameters);

  std::vector<Assertion> GetAssertions() const override;

  /*
    A single periodic column: the mask.
  */
  std::vector<std::vector<BaseFieldElement>> GetPeriodicColumnValues() const override;

  template <typename FieldElementT>
  void EvaluateTransition(
      const EvaluationFrame<FieldElementT>& frame, gsl::span<const FieldElementT> periodic_values,
      gsl::span<FieldElementT> result) const;

  Trace GetTrace() const;

 private:
  /*
    The values of the sum column at the start of every cycle.
  */
  std::vector<BaseFieldElement> CycleStartSums() const;

  const PublicInputs public_inputs_;
};

}  // namespace airkit

#include "airkit/air/periodic_counter/periodic_counter_air.inl"

#endif  // AIRKIT_AIR_PERIODIC_COUNTER_PERIODIC_COUNTER_AIR_H_
