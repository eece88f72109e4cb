#include "airkit/utils/json.h"

#include <fstream>
#include <sstream>
#include <utility>

namespace airkit {

JsonValue JsonValue::FromJsonCppValue(const Json::Value& value) {
  auto root = std::make_shared<const Json::Value>(value);
  const Json::Value* root_ptr = root.get();
  return JsonValue(std::move(root), root_ptr, "/");
}

JsonValue JsonValue::FromFile(const std::string& filename) {
  std::ifstream stream(filename);
  ASSERT_RELEASE(stream, "Could not open file: " + filename + ".");
  Json::CharReaderBuilder builder;
  Json::Value value;
  std::string errors;
  ASSERT_RELEASE(
      Json::parseFromStream(builder, stream, &value, &errors),
      "Failed to parse JSON file " + filename + ": " + errors);
  return FromJsonCppValue(value);
}

JsonValue JsonValue::FromString(const std::string& json_str) {
  std::istringstream stream(json_str);
  Json::CharReaderBuilder builder;
  Json::Value value;
  std::string errors;
  ASSERT_RELEASE(
      Json::parseFromStream(builder, stream, &value, &errors), "Failed to parse JSON: " + errors);
  return FromJsonCppValue(value);
}

JsonValue JsonValue::EmptyArray() { return FromJsonCppValue(Json::Value(Json::arrayValue)); }

JsonValue JsonValue::operator[](const std::string& name) const {
  ASSERT_RELEASE(HasValue(), "Missing configuration object: " + path_);
  AssertObject();
  return JsonValue(root_, &(*value_)[name], path_ + name + "/");
}

JsonValue JsonValue::operator[](size_t idx) const {
  AssertArray();
  ASSERT_RELEASE(
      idx < ArrayLength(), "Index " + std::to_string(idx) + " is out of range at " + path_ + ".");
  return JsonValue(
      root_, &(*value_)[static_cast<Json::ArrayIndex>(idx)], path_ + std::to_string(idx) + "/");
}

uint64_t JsonValue::AsUint64() const {
  AssertValueExists();
  ASSERT_RELEASE(
      value_->isUInt64(), "Configuration at " + path_ + " is expected to be a uint64.");
  return value_->asUInt64();
}

size_t JsonValue::AsSizeT() const {
  AssertInt();
  ASSERT_RELEASE(
      value_->isUInt64(), "Configuration at " + path_ + " is expected to be non-negative.");
  return value_->asUInt64();
}

bool JsonValue::AsBool() const {
  AssertBool();
  return value_->asBool();
}

std::string JsonValue::AsString() const {
  AssertString();
  return value_->asString();
}

std::vector<size_t> JsonValue::AsSizeTVector() const {
  return AsVector<size_t>([](const JsonValue& value) { return value.AsSizeT(); });
}

size_t JsonValue::ArrayLength() const {
  AssertArray();
  return value_->size();
}

std::string JsonValue::ToJsonString() const {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, *value_);
}

void JsonValue::AssertValueExists() const {
  ASSERT_RELEASE(HasValue(), "Missing configuration value: " + path_);
}

void JsonValue::AssertObject() const {
  AssertValueExists();
  ASSERT_RELEASE(
      value_->isObject(), "Configuration at " + path_ + " is expected to be an object.");
}

void JsonValue::AssertArray() const {
  AssertValueExists();
  ASSERT_RELEASE(value_->isArray(), "Configuration at " + path_ + " is expected to be an array.");
}

void JsonValue::AssertInt() const {
  AssertValueExists();
  ASSERT_RELEASE(
      value_->isIntegral() && !value_->isBool(),
      "Configuration at " + path_ + " is expected to be an integer.");
}

void JsonValue::AssertBool() const {
  AssertValueExists();
  ASSERT_RELEASE(value_->isBool(), "Configuration at " + path_ + " is expected to be a bool.");
}

void JsonValue::AssertString() const {
  AssertValueExists();
  ASSERT_RELEASE(
      value_->isString(), "Configuration at " + path_ + " is expected to be a string.");
}

}  // namespace airkit
