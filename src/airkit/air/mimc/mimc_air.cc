#include "airkit/air/mimc/mimc_air.h"

#include <string>
#include <utility>

#include "airkit/randomness/prng.h"
#include "airkit/utils/json_builder.h"

namespace airkit {

namespace {

/*
  Returns the trace column: the values of the chain after each round.
*/
std::vector<BaseFieldElement> ComputeColumn(const BaseFieldElement& input, uint64_t trace_length) {
  const std::vector<BaseFieldElement> round_constants =
      MimcAir::RoundConstants(MimcAir::Cycle(trace_length));
  std::vector<BaseFieldElement> column;
  column.reserve(trace_length);
  BaseFieldElement x = input;
  for (uint64_t i = 0; i < trace_length; ++i) {
    column.push_back(x);
    x = x * x * x + round_constants[i % round_constants.size()];
  }
  return column;
}

}  // namespace

auto MimcAir::PublicInputs::FromJson(const JsonValue& json) -> PublicInputs {
  return {json["input"].AsFieldElement<BaseFieldElement>(),
          json["output"].AsFieldElement<BaseFieldElement>()};
}

JsonValue MimcAir::PublicInputs::ToJson() const {
  JsonBuilder builder;
  builder["input"] = input;
  builder["output"] = output;
  return builder.Build();
}

auto MimcAir::PublicInputs::Compute(const BaseFieldElement& input, uint64_t trace_length)
    -> PublicInputs {
  return {input, ComputeColumn(input, trace_length).back()};
}

MimcAir::MimcAir(
    const TraceInfo& trace_info, const PublicInputs& public_inputs,
    const ProofParameters& proof_parameters)
    : Air(AirContext(
          trace_info, {TransitionConstraintDegree(3)}, kNumAssertions, proof_parameters)),
      public_inputs_(public_inputs) {
  ASSERT_RELEASE(
      trace_info.Width() == kNumColumns, "MimcAir requires a trace with a single column.");
}

std::vector<Assertion> MimcAir::GetAssertions() const {
  return {Assertion::Single(0, 0, public_inputs_.input),
          Assertion::Single(0, Context().TraceLength() - 1, public_inputs_.output)};
}

Trace MimcAir::GetTrace() const {
  std::vector<BaseFieldElement> column =
      ComputeColumn(public_inputs_.input, Context().TraceLength());
  ASSERT_RELEASE(
      column.back() == public_inputs_.output,
      "The output " + public_inputs_.output.ToString() + " does not match the input " +
          public_inputs_.input.ToString() + ".");
  std::vector<std::vector<BaseFieldElement>> columns;
  columns.push_back(std::move(column));
  return Trace(std::move(columns));
}

std::vector<BaseFieldElement> MimcAir::RoundConstants(size_t count) {
  const std::string seed = "MiMC round constants";
  std::vector<std::byte> seed_bytes;
  seed_bytes.reserve(seed.size());
  for (const char c : seed) {
    seed_bytes.push_back(std::byte(c));
  }
  Prng prng(seed_bytes);
  return prng.RandomFieldElementVector<BaseFieldElement>(count);
}

}  // namespace airkit
