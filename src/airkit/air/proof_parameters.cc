#include "airkit/air/proof_parameters.h"

#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"
#include "airkit/utils/json_builder.h"
#include "airkit/utils/serialization.h"

namespace airkit {

FieldExtension FieldExtensionFromDegree(size_t degree) {
  switch (degree) {
    case 1:
      return FieldExtension::kNone;
    case 2:
      return FieldExtension::kQuadratic;
    case 3:
      return FieldExtension::kCubic;
    default:
      THROW_AIRKIT_EXCEPTION(
          "Unsupported field extension degree " + std::to_string(degree) +
          ". Supported degrees are 1, 2 and 3.");
  }
}

std::string HashFunctionToString(HashFunction hash_function) {
  switch (hash_function) {
    case HashFunction::kBlake2s256:
      return "blake2s256";
    case HashFunction::kBlake2s160:
      return "blake2s160";
  }
  THROW_AIRKIT_EXCEPTION("Invalid hash function.");
}

HashFunction HashFunctionFromString(const std::string& name) {
  if (name == "blake2s256") {
    return HashFunction::kBlake2s256;
  }
  if (name == "blake2s160") {
    return HashFunction::kBlake2s160;
  }
  THROW_AIRKIT_EXCEPTION("Unsupported hash function: " + name + ".");
}

ProofParameters::ProofParameters(
    size_t num_queries, uint64_t blowup_factor, size_t grinding_bits,
    FieldExtension field_extension, HashFunction hash_function)
    : num_queries_(num_queries),
      blowup_factor_(blowup_factor),
      grinding_bits_(grinding_bits),
      field_extension_(field_extension),
      hash_function_(hash_function) {
  ASSERT_RELEASE(
      num_queries_ >= kMinNumQueries && num_queries_ <= kMaxNumQueries,
      "Number of queries must be between " + std::to_string(kMinNumQueries) + " and " +
          std::to_string(kMaxNumQueries) + ", got " + std::to_string(num_queries_) + ".");
  ASSERT_RELEASE(
      IsPowerOfTwo(blowup_factor_),
      "The blowup factor must be a power of 2, got " + std::to_string(blowup_factor_) + ".");
  ASSERT_RELEASE(
      blowup_factor_ >= kMinBlowupFactor && blowup_factor_ <= kMaxBlowupFactor,
      "The blowup factor must be between " + std::to_string(kMinBlowupFactor) + " and " +
          std::to_string(kMaxBlowupFactor) + ", got " + std::to_string(blowup_factor_) + ".");
  ASSERT_RELEASE(
      grinding_bits_ <= kMaxGrindingBits, "Grinding bits must not exceed " +
                                              std::to_string(kMaxGrindingBits) + ", got " +
                                              std::to_string(grinding_bits_) + ".");
}

ProofParameters ProofParameters::FromJson(const JsonValue& json) {
  const JsonValue extension_json = json["field_extension_degree"];
  const JsonValue hash_json = json["hash_function"];
  return ProofParameters(
      json["num_queries"].AsSizeT(), json["blowup_factor"].AsUint64(),
      json["grinding_bits"].AsSizeT(),
      extension_json.HasValue() ? FieldExtensionFromDegree(extension_json.AsSizeT())
                                : FieldExtension::kNone,
      hash_json.HasValue() ? HashFunctionFromString(hash_json.AsString())
                           : HashFunction::kBlake2s256);
}

JsonValue ProofParameters::ToJson() const {
  JsonBuilder builder;
  builder["num_queries"] = num_queries_;
  builder["blowup_factor"] = blowup_factor_;
  builder["grinding_bits"] = grinding_bits_;
  builder["field_extension_degree"] = FieldExtensionDegree();
  builder["hash_function"] = HashFunctionToString(hash_function_);
  return builder.Build();
}

std::vector<std::byte> ProofParameters::ToBytes() const {
  std::vector<std::byte> bytes;
  bytes.reserve(4 + sizeof(uint64_t));
  bytes.push_back(static_cast<std::byte>(hash_function_));
  bytes.push_back(static_cast<std::byte>(FieldExtensionDegree()));
  bytes.push_back(static_cast<std::byte>(grinding_bits_));
  bytes.push_back(static_cast<std::byte>(SafeLog2(blowup_factor_)));
  AppendSerialized(num_queries_, &bytes);
  return bytes;
}

bool ProofParameters::operator==(const ProofParameters& other) const {
  return num_queries_ == other.num_queries_ && blowup_factor_ == other.blowup_factor_ &&
         grinding_bits_ == other.grinding_bits_ && field_extension_ == other.field_extension_ &&
         hash_function_ == other.hash_function_;
}

}  // namespace airkit
