#include "airkit/air/proof_parameters.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/error_handling/test_utils.h"
#include "airkit/stl_utils/containers.h"

namespace airkit {
namespace {

using testing::ElementsAreArray;
using testing::HasSubstr;

TEST(ProofParameters, Accessors) {
  const ProofParameters params(32, 8, 16, FieldExtension::kQuadratic, HashFunction::kBlake2s160);
  EXPECT_EQ(32U, params.NumQueries());
  EXPECT_EQ(8U, params.BlowupFactor());
  EXPECT_EQ(16U, params.GrindingBits());
  EXPECT_EQ(FieldExtension::kQuadratic, params.GetFieldExtension());
  EXPECT_EQ(2U, params.FieldExtensionDegree());
  EXPECT_EQ(HashFunction::kBlake2s160, params.GetHashFunction());
}

TEST(ProofParameters, Ranges) {
  const auto make = [](size_t num_queries, uint64_t blowup_factor, size_t grinding_bits) {
    return ProofParameters(
        num_queries, blowup_factor, grinding_bits, FieldExtension::kNone,
        HashFunction::kBlake2s256);
  };
  EXPECT_NO_THROW(make(1, 2, 0));
  EXPECT_NO_THROW(make(128, 128, 32));
  EXPECT_ASSERT(make(0, 8, 0), HasSubstr("Number of queries"));
  EXPECT_ASSERT(make(129, 8, 0), HasSubstr("Number of queries"));
  EXPECT_ASSERT(make(10, 1, 0), HasSubstr("between 2 and 128"));
  EXPECT_ASSERT(make(10, 256, 0), HasSubstr("between 2 and 128"));
  EXPECT_ASSERT(make(10, 12, 0), HasSubstr("power of 2"));
  EXPECT_ASSERT(make(10, 8, 33), HasSubstr("Grinding bits"));
}

TEST(ProofParameters, FromJson) {
  const JsonValue json = JsonValue::FromString(R"({
    "num_queries": 42,
    "blowup_factor": 16,
    "grinding_bits": 20,
    "field_extension_degree": 3,
    "hash_function": "blake2s160"
  })");
  EXPECT_EQ(
      ProofParameters(42, 16, 20, FieldExtension::kCubic, HashFunction::kBlake2s160),
      ProofParameters::FromJson(json));
}

TEST(ProofParameters, FromJsonDefaults) {
  const JsonValue json =
      JsonValue::FromString(R"({"num_queries": 4, "blowup_factor": 4, "grinding_bits": 0})");
  EXPECT_EQ(
      ProofParameters(4, 4, 0, FieldExtension::kNone, HashFunction::kBlake2s256),
      ProofParameters::FromJson(json));
}

TEST(ProofParameters, FromJsonErrors) {
  EXPECT_ASSERT(
      ProofParameters::FromJson(JsonValue::FromString(R"({"num_queries": 4, "grinding_bits": 0})")),
      HasSubstr("Missing configuration value: /blowup_factor/"));
  EXPECT_ASSERT(
      ProofParameters::FromJson(JsonValue::FromString(
          R"({"num_queries": 4, "blowup_factor": 4, "grinding_bits": 0,
              "field_extension_degree": 4})")),
      HasSubstr("Unsupported field extension degree 4"));
  EXPECT_ASSERT(
      ProofParameters::FromJson(JsonValue::FromString(
          R"({"num_queries": 4, "blowup_factor": 4, "grinding_bits": 0,
              "hash_function": "sha256"})")),
      HasSubstr("Unsupported hash function: sha256"));
}

TEST(ProofParameters, JsonRoundTrip) {
  const ProofParameters params(7, 32, 3, FieldExtension::kQuadratic, HashFunction::kBlake2s256);
  EXPECT_EQ(params, ProofParameters::FromJson(params.ToJson()));
}

TEST(ProofParameters, ToBytes) {
  const ProofParameters params(300, 8, 16, FieldExtension::kCubic, HashFunction::kBlake2s160);
  EXPECT_THAT(
      params.ToBytes(),
      ElementsAreArray(
          MakeByteArray<0x01, 0x03, 0x10, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x2c>()));
  EXPECT_NE(
      params.ToBytes(),
      ProofParameters(300, 16, 16, FieldExtension::kCubic, HashFunction::kBlake2s160).ToBytes());
}

}  // namespace
}  // namespace airkit
