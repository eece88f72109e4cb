#include "airkit/main/air_info_helper.h"

#include "airkit/air/fibonacci/fibonacci_air.h"
#include "airkit/air/increment/increment_air.h"
#include "airkit/air/mimc/mimc_air.h"
#include "airkit/air/periodic_counter/periodic_counter_air.h"

namespace airkit {

const std::vector<std::string>& SupportedAirNames() {
  static const std::vector<std::string> kNames{"increment", "fibonacci", "mimc",
                                               "periodic_counter"};
  return kNames;
}

std::vector<std::byte> GetPublicSeed(
    const ProofParameters& proof_parameters, const JsonValue& public_input) {
  std::vector<std::byte> seed = proof_parameters.ToBytes();
  for (const char c : public_input.ToJsonString()) {
    seed.push_back(static_cast<std::byte>(c));
  }
  return seed;
}

JsonValue AirInfoFromJson(
    const std::string& air_name, uint64_t trace_length, const JsonValue& public_input,
    const JsonValue& parameters) {
  const ProofParameters proof_parameters = ProofParameters::FromJson(parameters);
  if (air_name == "increment") {
    return GetAirInfo<IncrementAir>(
        trace_length, IncrementAir::PublicInputs::FromJson(public_input), proof_parameters);
  }
  if (air_name == "fibonacci") {
    return GetAirInfo<FibonacciAir>(
        trace_length, FibonacciAir::PublicInputs::FromJson(public_input), proof_parameters);
  }
  if (air_name == "mimc") {
    return GetAirInfo<MimcAir>(
        trace_length, MimcAir::PublicInputs::FromJson(public_input), proof_parameters);
  }
  if (air_name == "periodic_counter") {
    return GetAirInfo<PeriodicCounterAir>(
        trace_length, PeriodicCounterAir::PublicInputs::FromJson(public_input), proof_parameters);
  }
  THROW_AIRKIT_EXCEPTION("Unknown computation: " + air_name + ".");
}

}  // namespace airkit
