#include "airkit/air/periodic_counter/periodic_counter_air.h"

#include <string>
#include <utility>

#include "airkit/math/math.h"
#include "airkit/utils/json_builder.h"

namespace airkit {

auto PeriodicCounterAir::PublicInputs::FromJson(const JsonValue& json) -> PublicInputs {
  return {json["cycle_length"].AsUint64(), json["initial"].AsFieldElement<BaseFieldElement>()};
}

JsonValue PeriodicCounterAir::PublicInputs::ToJson() const {
  JsonBuilder builder;
  builder["cycle_length"] = cycle_length;
  builder["initial"] = initial;
  return builder.Build();
}

PeriodicCounterAir::PeriodicCounterAir(
    const TraceInfo& trace_info, const PublicInputs& public_inputs,
    const ProofParameters& proof_parameters)
    : Air(AirContext(
          trace_info,
          {TransitionConstraintDegree(1, {public_inputs.cycle_length}),
           TransitionConstraintDegree(1)},
          kNumAssertions, proof_parameters)),
      public_inputs_(public_inputs) {
  ASSERT_RELEASE(
      trace_info.Width() == kNumColumns, "PeriodicCounterAir requires a trace with two columns.");
}

std::vector<Assertion> PeriodicCounterAir::GetAssertions() const {
  const uint64_t cycle_length = public_inputs_.cycle_length;
  return {Assertion::Periodic(0, 0, cycle_length, BaseFieldElement::Zero()),
          Assertion::Single(0, cycle_length - 1, BaseFieldElement::FromUint(cycle_length - 1)),
          Assertion::Sequence(1, 0, cycle_length, CycleStartSums())};
}

std::vector<std::vector<BaseFieldElement>> PeriodicCounterAir::GetPeriodicColumnValues() const {
  std::vector<BaseFieldElement> mask(public_inputs_.cycle_length, BaseFieldElement::One());
  mask.back() = BaseFieldElement::Zero();
  return {mask};
}

std::vector<BaseFieldElement> PeriodicCounterAir::CycleStartSums() const {
  const uint64_t cycle_length = public_inputs_.cycle_length;
  const BaseFieldElement cycle_sum =
      BaseFieldElement::FromUint(cycle_length * (cycle_length - 1) / 2);
  std::vector<BaseFieldElement> sums;
  const uint64_t n_cycles = SafeDiv(Context().TraceLength(), cycle_length);
  sums.reserve(n_cycles);
  BaseFieldElement sum = public_inputs_.initial;
  for (uint64_t i = 0; i < n_cycles; ++i) {
    sums.push_back(sum);
    sum += cycle_sum;
  }
  return sums;
}

Trace PeriodicCounterAir::GetTrace() const {
  const uint64_t trace_length = Context().TraceLength();
  const uint64_t cycle_length = public_inputs_.cycle_length;
  std::vector<std::vector<BaseFieldElement>> columns(kNumColumns);
  for (auto& column : columns) {
    column.reserve(trace_length);
  }
  BaseFieldElement sum = public_inputs_.initial;
  for (uint64_t i = 0; i < trace_length; ++i) {
    const BaseFieldElement counter = BaseFieldElement::FromUint(i % cycle_length);
    columns[0].push_back(counter);
    columns[1].push_back(sum);
    sum += counter;
  }
  return Trace(std::move(columns));
}

}  // namespace airkit
