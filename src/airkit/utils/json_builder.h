#ifndef AIRKIT_UTILS_JSON_BUILDER_H_
#define AIRKIT_UTILS_JSON_BUILDER_H_

#include <string>
#include <type_traits>

#include "json/json.h"

#include "airkit/utils/json.h"

namespace airkit {

/*
  Builds a JSON document field by field.
  Usage:
    JsonBuilder builder;
    builder["trace"]["length"] = 1024;
    builder["values"].Append(BaseFieldElement::One());
    JsonValue json = builder.Build();
*/
class JsonBuilder {
 public:
  class JsonBuilderValue {
   public:
    explicit JsonBuilderValue(Json::Value* value) : value_(value) {}

    JsonBuilderValue operator[](const std::string& name) {
      return JsonBuilderValue(&(*value_)[name]);
    }

    template <typename T>
    JsonBuilderValue& operator=(const T& value) {
      *value_ = ToJsonCpp(value);
      return *this;
    }

    template <typename T>
    JsonBuilderValue& Append(const T& value) {
      value_->append(ToJsonCpp(value));
      return *this;
    }

   private:
    template <typename T>
    static Json::Value ToJsonCpp(const T& value) {
      if constexpr (std::is_same_v<T, bool>) {
        return Json::Value(value);
      } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        return Json::Value(static_cast<Json::Int64>(value));
      } else if constexpr (std::is_integral_v<T>) {
        return Json::Value(static_cast<Json::UInt64>(value));
      } else if constexpr (std::is_floating_point_v<T>) {
        return Json::Value(static_cast<double>(value));
      } else if constexpr (std::is_constructible_v<std::string, const T&>) {
        return Json::Value(std::string(value));
      } else if constexpr (std::is_same_v<T, JsonValue>) {
        return value.GetValue();
      } else {
        // Field elements are written as hex strings.
        return Json::Value(value.ToString());
      }
    }

    Json::Value* value_;
  };

  JsonBuilderValue operator[](const std::string& name) { return JsonBuilderValue(&root_)[name]; }

  JsonValue Build() const { return JsonValue::FromJsonCppValue(root_); }

 private:
  Json::Value root_ = Json::Value(Json::objectValue);
};

}  // namespace airkit

#endif  // AIRKIT_UTILS_JSON_BUILDER_H_
