/*
  Implements an AIR for a MiMC-style permutation chain:
    "Applying x -> x^3 + k_i for n - 1 rounds to input gives output",
  where k_i are public round constants that repeat every kRoundConstantsCycle rounds (or every n
  rounds for shorter traces). The round constants are given to the constraints through a periodic
  column.
*/
#ifndef AIRKIT_AIR_MIMC_MIMC_AIR_H_
#define AIRKIT_AIR_MIMC_MIMC_AIR_H_

#include <algorithm>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/air.h"
#include "airkit/air/trace.h"
#include "airkit/utils/json.h"

namespace airkit {

class MimcAir : public Air {
 public:
  static constexpr size_t kNumColumns = 1;
  static constexpr size_t kNumAssertions = 2;
  static constexpr uint64_t kRoundConstantsCycle = 32;

  struct PublicInputs {
    BaseFieldElement input;
    BaseFieldElement output;

    static PublicInputs FromJson(const JsonValue& json);
    JsonValue ToJson() const;

    static PublicInputs Compute(const BaseFieldElement& input, uint64_t trace_length);
  };

  MimcAir(
      const TraceInfo& trace_info, const PublicInputs& public_inputs,
      const ProofParameters& proof_parameters);

  std::vector<Assertion> GetAssertions() const override;

  /*
    A single periodic column with the round constants.
  */
  std::vector<std::vector<BaseFieldElement>> GetPeriodicColumnValues() const override {
    return {RoundConstants(Cycle(Context().TraceLength()))};
  }

  template <typename FieldElementT>
  void EvaluateTransition(
      const EvaluationFrame<FieldElementT>& frame, gsl::span<const FieldElementT> periodic_values,
      gsl::span<FieldElementT> result) const;

  Trace GetTrace() const;

  /*
    The first count round constants, derived deterministically from a fixed seed.
  */
  static std::vector<BaseFieldElement> RoundConstants(size_t count);

  /*
    The period of the round constants for a trace of the given length.
  */
  static uint64_t Cycle(uint64_t trace_length) {
    return std::min(kRoundConstantsCycle, trace_length);
  }

 private:
  const PublicInputs public_inputs_;
};

}  // namespace airkit

#include "airkit/air/mimc/mimc_air.inl"

#endif  // AIRKIT_AIR_MIMC_MIMC_AIR_H_
