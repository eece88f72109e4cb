#include "airkit/air/increment/increment_air.h"

#include "airkit/utils/json_builder.h"

namespace airkit {

auto IncrementAir::PublicInputs::FromJson(const JsonValue& json) -> PublicInputs {
  return {json["start"].AsFieldElement<BaseFieldElement>(),
          json["end"].AsFieldElement<BaseFieldElement>()};
}

JsonValue IncrementAir::PublicInputs::ToJson() const {
  JsonBuilder builder;
  builder["start"] = start;
  builder["end"] = end;
  return builder.Build();
}

auto IncrementAir::PublicInputs::Compute(const BaseFieldElement& start, uint64_t trace_length)
    -> PublicInputs {
  return {start, start + BaseFieldElement::FromUint(trace_length - 1)};
}

IncrementAir::IncrementAir(
    const TraceInfo& trace_info, const PublicInputs& public_inputs,
    const ProofParameters& proof_parameters)
    : Air(AirContext(
          trace_info, {TransitionConstraintDegree(1)}, kNumAssertions, proof_parameters)),
      public_inputs_(public_inputs) {
  ASSERT_RELEASE(
      trace_info.Width() == kNumColumns, "IncrementAir requires a trace with a single column.");
}

std::vector<Assertion> IncrementAir::GetAssertions() const {
  return {Assertion::Single(0, 0, public_inputs_.start),
          Assertion::Single(0, Context().TraceLength() - 1, public_inputs_.end)};
}

Trace IncrementAir::GetTrace() const {
  std::vector<BaseFieldElement> column;
  column.reserve(Context().TraceLength());
  BaseFieldElement value = public_inputs_.start;
  for (uint64_t i = 0; i < Context().TraceLength(); ++i) {
    column.push_back(value);
    value += BaseFieldElement::One();
  }
  ASSERT_RELEASE(
      column.back() == public_inputs_.end,
      "The end value " + public_inputs_.end.ToString() + " is not reached from the start value " +
          public_inputs_.start.ToString() + ".");
  std::vector<std::vector<BaseFieldElement>> columns;
  columns.push_back(std::move(column));
  return Trace(std::move(columns));
}

}  // namespace airkit
