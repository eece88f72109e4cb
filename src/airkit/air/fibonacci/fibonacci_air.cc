#include "airkit/air/fibonacci/fibonacci_air.h"

#include <utility>

#include "airkit/utils/json_builder.h"

namespace airkit {

namespace {

/*
  Returns the two columns of the trace of the given length.
*/
std::vector<std::vector<BaseFieldElement>> ComputeColumns(uint64_t trace_length) {
  std::vector<std::vector<BaseFieldElement>> columns(FibonacciAir::kNumColumns);
  for (auto& column : columns) {
    column.reserve(trace_length);
  }
  BaseFieldElement a = BaseFieldElement::One();
  BaseFieldElement b = BaseFieldElement::One();
  for (uint64_t i = 0; i < trace_length; ++i) {
    columns[0].push_back(a);
    columns[1].push_back(b);
    a += b;
    b += a;
  }
  return columns;
}

}  // namespace

auto FibonacciAir::PublicInputs::FromJson(const JsonValue& json) -> PublicInputs {
  return {json["result"].AsFieldElement<BaseFieldElement>()};
}

JsonValue FibonacciAir::PublicInputs::ToJson() const {
  JsonBuilder builder;
  builder["result"] = result;
  return builder.Build();
}

auto FibonacciAir::PublicInputs::Compute(uint64_t trace_length) -> PublicInputs {
  return {ComputeColumns(trace_length)[1].back()};
}

FibonacciAir::FibonacciAir(
    const TraceInfo& trace_info, const PublicInputs& public_inputs,
    const ProofParameters& proof_parameters)
    : Air(AirContext(
          trace_info, {TransitionConstraintDegree(1), TransitionConstraintDegree(1)},
          kNumAssertions, proof_parameters)),
      public_inputs_(public_inputs) {
  ASSERT_RELEASE(
      trace_info.Width() == kNumColumns, "FibonacciAir requires a trace with two columns.");
}

std::vector<Assertion> FibonacciAir::GetAssertions() const {
  return {Assertion::Single(0, 0, BaseFieldElement::One()),
          Assertion::Single(1, 0, BaseFieldElement::One()),
          Assertion::Single(1, Context().TraceLength() - 1, public_inputs_.result)};
}

Trace FibonacciAir::GetTrace() const {
  std::vector<std::vector<BaseFieldElement>> columns = ComputeColumns(Context().TraceLength());
  ASSERT_RELEASE(
      columns[1].back() == public_inputs_.result,
      "The result " + public_inputs_.result.ToString() +
          " is not the 2n-th Fibonacci element for n = " +
          std::to_string(Context().TraceLength()) + ".");
  return Trace(std::move(columns));
}

}  // namespace airkit
