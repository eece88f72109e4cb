namespace airkit {

template <typename FieldElementT>
FieldElementT JsonValue::AsFieldElement() const {
  const std::string str = AsString();
  ASSERT_RELEASE(
      str.size() > 2 && str.compare(0, 2, "0x") == 0,
      "Configuration at " + path_ + " is expected to be a 0x-prefixed hex string, got \"" + str +
          "\".");
  return FieldElementT::FromString(str);
}

template <typename T, typename Func>
std::vector<T> JsonValue::AsVector(const Func& func) const {
  const size_t length = ArrayLength();
  std::vector<T> res;
  res.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    res.push_back(func((*this)[i]));
  }
  return res;
}

}  // namespace airkit
