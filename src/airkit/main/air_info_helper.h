#ifndef AIRKIT_MAIN_AIR_INFO_HELPER_H_
#define AIRKIT_MAIN_AIR_INFO_HELPER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/proof_parameters.h"
#include "airkit/utils/json.h"
#include "airkit/utils/json_builder.h"

namespace airkit {

/*
  Names of the example computations accepted by AirInfoFromJson().
*/
const std::vector<std::string>& SupportedAirNames();

/*
  Returns the public seed of the coefficients: the proof parameters followed by the canonical JSON
  encoding of the public input. Binding both to the seed makes the coefficients change whenever
  the statement does.
*/
std::vector<std::byte> GetPublicSeed(
    const ProofParameters& proof_parameters, const JsonValue& public_input);

/*
  Builds AirT over a trace of the given length, generates and validates its trace, derives the
  composition coefficients from the public seed and evaluates the composition polynomial on a
  coset. Returns a JSON summary with the context, the divisors and the constraint groups, which is
  also logged.
*/
template <typename AirT>
JsonValue GetAirInfo(
    uint64_t trace_length, const typename AirT::PublicInputs& public_inputs,
    const ProofParameters& proof_parameters);

/*
  Same as GetAirInfo(), with the computation selected by name (see SupportedAirNames()) and the
  public input and proof parameters read from JSON.
*/
JsonValue AirInfoFromJson(
    const std::string& air_name, uint64_t trace_length, const JsonValue& public_input,
    const JsonValue& parameters);

}  // namespace airkit

#include "airkit/main/air_info_helper.inl"

#endif  // AIRKIT_MAIN_AIR_INFO_HELPER_H_
