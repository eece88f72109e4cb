#ifndef AIRKIT_AIR_PROOF_PARAMETERS_H_
#define AIRKIT_AIR_PROOF_PARAMETERS_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "airkit/utils/json.h"

namespace airkit {

/*
  The field in which the composition and DEEP coefficients are drawn. The value is the degree of
  the extension over the base field.
*/
enum class FieldExtension { kNone = 1, kQuadratic = 2, kCubic = 3 };

enum class HashFunction { kBlake2s256, kBlake2s160 };

FieldExtension FieldExtensionFromDegree(size_t degree);

std::string HashFunctionToString(HashFunction hash_function);
HashFunction HashFunctionFromString(const std::string& name);

/*
  The soundness and performance parameters of a proof. They are chosen by the caller and are
  only consumed here: the blowup factor bounds the degree of the transition constraints (see
  AirContext), and the whole set is bound to the public coin through ToBytes().
*/
class ProofParameters {
 public:
  static constexpr size_t kMinNumQueries = 1;
  static constexpr size_t kMaxNumQueries = 128;
  static constexpr uint64_t kMinBlowupFactor = 2;
  static constexpr uint64_t kMaxBlowupFactor = 128;
  static constexpr size_t kMaxGrindingBits = 32;

  ProofParameters(
      size_t num_queries, uint64_t blowup_factor, size_t grinding_bits,
      FieldExtension field_extension, HashFunction hash_function);

  /*
    Reads the parameters from a JSON object of the form:
      {
        "num_queries": 32,
        "blowup_factor": 8,
        "grinding_bits": 16,
        "field_extension_degree": 2,
        "hash_function": "blake2s256"
      }
    field_extension_degree and hash_function are optional (1 and blake2s256 by default).
  */
  static ProofParameters FromJson(const JsonValue& json);

  JsonValue ToJson() const;

  /*
    A canonical encoding, used to bind the parameters to the public coin:
    hash function, field extension degree, grinding bits and blowup factor as single bytes,
    followed by the number of queries as a big-endian uint64.
  */
  std::vector<std::byte> ToBytes() const;

  size_t NumQueries() const { return num_queries_; }
  uint64_t BlowupFactor() const { return blowup_factor_; }
  size_t GrindingBits() const { return grinding_bits_; }
  FieldExtension GetFieldExtension() const { return field_extension_; }
  size_t FieldExtensionDegree() const { return static_cast<size_t>(field_extension_); }
  HashFunction GetHashFunction() const { return hash_function_; }

  bool operator==(const ProofParameters& other) const;
  bool operator!=(const ProofParameters& other) const { return !(*this == other); }

 private:
  size_t num_queries_;
  uint64_t blowup_factor_;
  size_t grinding_bits_;
  FieldExtension field_extension_;
  HashFunction hash_function_;
};

}  // namespace airkit

#endif  // AIRKIT_AIR_PROOF_PARAMETERS_H_
