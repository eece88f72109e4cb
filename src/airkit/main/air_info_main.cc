/*
  Prints the arithmetization of one of the example computations: builds its AIR from a proof
  parameters file and a public input file, generates and validates the trace, derives the
  composition coefficients from the public seed and logs the context, the divisors and the
  constraint groups.

  Example:
    air_info_main --air=fibonacci --trace_length=1024 --parameter_file=parameters.json \
      --public_input_file=fibonacci_public_input.json --logtostderr
*/

#include <algorithm>
#include <fstream>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "airkit/main/air_info_helper.h"
#include "airkit/utils/flag_validators.h"
#include "airkit/utils/json.h"
#include "airkit/utils/profiling.h"

namespace {

bool ValidateAirName(const char* /*flagname*/, const std::string& air_name) {
  const auto& names = airkit::SupportedAirNames();
  return std::find(names.begin(), names.end(), air_name) != names.end();
}

}  // namespace

DEFINE_string(air, "", "The computation: increment, fibonacci, mimc or periodic_counter.");
DEFINE_validator(air, &ValidateAirName);

DEFINE_uint64(trace_length, 1024, "The length of the trace. Must be a power of 2.");
DEFINE_validator(trace_length, &airkit::ValidateTraceLength);

DEFINE_string(parameter_file, "", "Path to the JSON file containing the proof parameters.");
DEFINE_validator(parameter_file, &airkit::ValidateInputFile);

DEFINE_string(public_input_file, "", "Path to the JSON file containing the public input.");
DEFINE_validator(public_input_file, &airkit::ValidateInputFile);

DEFINE_string(
    out_file, "", "Optional. Path to the output file, into which the summary is written.");
DEFINE_validator(out_file, &airkit::ValidateOptionalOutputFile);

int main(int argc, char** argv) {
  using namespace airkit;  // NOLINT
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT

  ProfilingBlock profiling_block("Air info");
  const JsonValue summary = AirInfoFromJson(
      FLAGS_air, FLAGS_trace_length, JsonValue::FromFile(FLAGS_public_input_file),
      JsonValue::FromFile(FLAGS_parameter_file));
  profiling_block.CloseBlock();

  LOG(INFO) << summary.ToJsonString();
  if (!FLAGS_out_file.empty()) {
    std::ofstream out(FLAGS_out_file);
    out << summary.ToJsonString() << std::endl;
  }
  return 0;
}
