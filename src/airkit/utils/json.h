#ifndef AIRKIT_UTILS_JSON_H_
#define AIRKIT_UTILS_JSON_H_

#include <memory>
#include <string>
#include <vector>

#include "json/json.h"

#include "airkit/error_handling/error_handling.h"

namespace airkit {

/*
  A read-only view of a JSON document, used for parameter and public input files.
  Every accessor validates the type of the value and reports failures together with the path of
  the value inside the document, e.g. "Configuration at /num_queries/ is expected to be a uint64.".
*/
class JsonValue {
 public:
  static JsonValue FromJsonCppValue(const Json::Value& value);
  static JsonValue FromFile(const std::string& filename);
  static JsonValue FromString(const std::string& json_str);
  static JsonValue EmptyArray();

  JsonValue operator[](const std::string& name) const;
  JsonValue operator[](size_t idx) const;

  /*
    Returns false if the value is missing (null).
  */
  bool HasValue() const { return !value_->isNull(); }

  uint64_t AsUint64() const;
  size_t AsSizeT() const;
  bool AsBool() const;
  std::string AsString() const;
  std::vector<size_t> AsSizeTVector() const;

  /*
    Parses a "0x"-prefixed hex string.
  */
  template <typename FieldElementT>
  FieldElementT AsFieldElement() const;

  template <typename FieldElementT>
  std::vector<FieldElementT> AsFieldElementVector() const {
    return AsVector<FieldElementT>(
        [](const JsonValue& value) { return value.AsFieldElement<FieldElementT>(); });
  }

  size_t ArrayLength() const;

  std::string ToJsonString() const;

  const Json::Value& GetValue() const { return *value_; }

 private:
  JsonValue(std::shared_ptr<const Json::Value> root, const Json::Value* value, std::string path)
      : root_(std::move(root)), value_(value), path_(std::move(path)) {}

  void AssertValueExists() const;
  void AssertObject() const;
  void AssertArray() const;
  void AssertInt() const;
  void AssertBool() const;
  void AssertString() const;

  template <typename T, typename Func>
  std::vector<T> AsVector(const Func& func) const;

  // Keeps the document alive while views into it exist.
  std::shared_ptr<const Json::Value> root_;
  const Json::Value* value_;
  std::string path_;
};

}  // namespace airkit

#include "airkit/utils/json.inl"

#endif  // AIRKIT_UTILS_JSON_H_
