#include "airkit/utils/json.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/algebra/fields/base_field_element.h"
#include "airkit/error_handling/test_utils.h"
#include "airkit/utils/json_builder.h"

namespace airkit {
namespace {

using testing::ElementsAre;
using testing::HasSubstr;

TEST(JsonValue, Accessors) {
  const JsonValue json = JsonValue::FromString(R"({
    "num_queries": 32,
    "enabled": true,
    "name": "fib",
    "sizes": [1, 2, 3],
    "values": ["0x1", "0x10"],
    "nested": {"step": 7}
  })");
  EXPECT_EQ(32U, json["num_queries"].AsUint64());
  EXPECT_TRUE(json["enabled"].AsBool());
  EXPECT_EQ("fib", json["name"].AsString());
  EXPECT_THAT(json["sizes"].AsSizeTVector(), ElementsAre(1, 2, 3));
  EXPECT_THAT(
      json["values"].AsFieldElementVector<BaseFieldElement>(),
      ElementsAre(BaseFieldElement::One(), BaseFieldElement::FromUint(16)));
  EXPECT_EQ(7U, json["nested"]["step"].AsSizeT());
  EXPECT_EQ(3U, json["sizes"].ArrayLength());
  EXPECT_FALSE(json["missing"].HasValue());
}

TEST(JsonValue, ErrorsReportThePath) {
  const JsonValue json = JsonValue::FromString(R"({"a": {"b": "x"}, "c": [-1]})");
  EXPECT_ASSERT(
      json["a"]["b"].AsUint64(), HasSubstr("Configuration at /a/b/ is expected to be"));
  EXPECT_ASSERT(json["a"]["missing"].AsString(), HasSubstr("/a/missing/"));
  EXPECT_ASSERT(json["c"][0].AsSizeT(), HasSubstr("/c/0/"));
  EXPECT_ASSERT(json["c"][1], HasSubstr("Index 1 is out of range at /c/."));
  EXPECT_ASSERT(json["a"].AsBool(), HasSubstr("expected to be a bool"));
  EXPECT_ASSERT(
      json["a"]["b"].AsFieldElement<BaseFieldElement>(),
      HasSubstr("Configuration at /a/b/ is expected to be a 0x-prefixed hex string, got \"x\"."));
  EXPECT_ASSERT(JsonValue::FromString("{"), HasSubstr("Failed to parse JSON"));
  EXPECT_ASSERT(JsonValue::FromFile("/nonexistent/file.json"), HasSubstr("Could not open file"));
}

TEST(JsonBuilder, Build) {
  JsonBuilder builder;
  builder["trace"]["length"] = uint64_t{1024};
  builder["trace"]["width"] = 2;
  builder["name"] = "mimc";
  builder["values"].Append(BaseFieldElement::FromUint(5));
  builder["values"].Append(BaseFieldElement::FromUint(6));
  const JsonValue json = builder.Build();

  EXPECT_EQ(1024U, json["trace"]["length"].AsUint64());
  EXPECT_EQ(2U, json["trace"]["width"].AsSizeT());
  EXPECT_EQ("mimc", json["name"].AsString());
  EXPECT_THAT(
      json["values"].AsFieldElementVector<BaseFieldElement>(),
      ElementsAre(BaseFieldElement::FromUint(5), BaseFieldElement::FromUint(6)));
  EXPECT_EQ(json.ToJsonString(), JsonValue::FromString(json.ToJsonString()).ToJsonString());
}

}  // namespace
}  // namespace airkit
