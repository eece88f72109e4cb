#include "airkit/main/air_info_helper.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/error_handling/test_utils.h"

namespace airkit {
namespace {

using testing::ElementsAre;
using testing::HasSubstr;

const JsonValue kParameters = JsonValue::FromString(R"({
  "num_queries": 16,
  "blowup_factor": 4,
  "grinding_bits": 8,
  "field_extension_degree": 3
})");

TEST(AirInfo, Fibonacci) {
  const JsonValue summary =
      AirInfoFromJson("fibonacci", 8, JsonValue::FromString(R"({"result": "0x3db"})"), kParameters);

  EXPECT_EQ(2U, summary["trace"]["width"].AsSizeT());
  EXPECT_EQ(8U, summary["trace"]["length"].AsUint64());
  EXPECT_EQ(1U, summary["context"]["ce_blowup_factor"].AsUint64());
  EXPECT_EQ(7U, summary["context"]["composition_degree"].AsUint64());
  EXPECT_EQ(32U, summary["context"]["lde_domain_size"].AsUint64());
  EXPECT_EQ(7U, summary["composition_degree"].AsUint64());
  EXPECT_EQ(3U, summary["assertions"].ArrayLength());

  ASSERT_EQ(1U, summary["transition_groups"].ArrayLength());
  EXPECT_EQ(7U, summary["transition_groups"][0]["evaluation_degree"].AsUint64());
  EXPECT_THAT(summary["transition_groups"][0]["constraints"].AsSizeTVector(), ElementsAre(0, 1));

  ASSERT_EQ(2U, summary["boundary_groups"].ArrayLength());
  EXPECT_EQ("x^1 - g^0", summary["boundary_groups"][0]["divisor"].AsString());
  EXPECT_THAT(summary["boundary_groups"][0]["columns"].AsSizeTVector(), ElementsAre(0, 1));
  EXPECT_EQ("x^1 - g^7", summary["boundary_groups"][1]["divisor"].AsString());
  EXPECT_THAT(summary["boundary_groups"][1]["columns"].AsSizeTVector(), ElementsAre(1));

  // One pair per trace column, one per composition column and one for the degree adjustment.
  EXPECT_EQ(4U, summary["num_deep_coefficient_pairs"].AsSizeT());
}

TEST(AirInfo, PeriodicCounter) {
  const JsonValue summary = AirInfoFromJson(
      "periodic_counter", 32,
      JsonValue::FromString(R"({"cycle_length": 8, "initial": "0x64"})"), kParameters);
  EXPECT_EQ(63U, summary["composition_degree"].AsUint64());
  EXPECT_EQ(2U, summary["transition_groups"].ArrayLength());
  EXPECT_EQ(3U, summary["boundary_groups"].ArrayLength());
}

TEST(AirInfo, InvalidInput) {
  EXPECT_ASSERT(
      AirInfoFromJson("rescue", 8, JsonValue::FromString("{}"), kParameters),
      HasSubstr("Unknown computation: rescue."));
  EXPECT_ASSERT(
      AirInfoFromJson("fibonacci", 8, JsonValue::FromString(R"({"result": "0x3dc"})"), kParameters),
      HasSubstr("Fibonacci"));
  EXPECT_ASSERT(
      AirInfoFromJson("increment", 8, JsonValue::FromString(R"({"start": "0x1"})"), kParameters),
      HasSubstr("/end/"));
}

TEST(AirInfo, PublicSeedBindsTheStatement) {
  const ProofParameters parameters = ProofParameters::FromJson(kParameters);
  const JsonValue input_a = JsonValue::FromString(R"({"result": "0x3db"})");
  const JsonValue input_b = JsonValue::FromString(R"({"result": "0x3dc"})");
  EXPECT_EQ(GetPublicSeed(parameters, input_a), GetPublicSeed(parameters, input_a));
  EXPECT_NE(GetPublicSeed(parameters, input_a), GetPublicSeed(parameters, input_b));

  const ProofParameters other_parameters(
      16, 8, 8, FieldExtension::kCubic, HashFunction::kBlake2s256);
  EXPECT_NE(GetPublicSeed(parameters, input_a), GetPublicSeed(other_parameters, input_a));
}

}  // namespace
}  // namespace airkit
