namespace airkit {

ALWAYS_INLINE QuadraticExtensionFieldElement QuadraticExtensionFieldElement::operator*(
    const QuadraticExtensionFieldElement& rhs) const {
  // (a0 + a1 phi)(b0 + b1 phi) = (a0 b0 + a1 b1) + (a0 b1 + a1 b0 + a1 b1) phi,
  // using phi^2 = phi + 1.
  const BaseFieldElement mul00 = coef0_ * rhs.coef0_;
  const BaseFieldElement mul11 = coef1_ * rhs.coef1_;
  const BaseFieldElement sum_mul = (coef0_ + coef1_) * (rhs.coef0_ + rhs.coef1_);
  return {mul00 + mul11, sum_mul - mul00};
}

inline QuadraticExtensionFieldElement QuadraticExtensionFieldElement::Inverse() const {
  ASSERT_RELEASE(*this != Zero(), "Zero does not have an inverse.");
  // z * Conjugate(z) = a0^2 + a0 a1 - a1^2 is in the base field.
  const BaseFieldElement norm = coef0_ * coef0_ + coef0_ * coef1_ - coef1_ * coef1_;
  return Conjugate() * norm.Inverse();
}

inline void QuadraticExtensionFieldElement::ToBytes(gsl::span<std::byte> span_out) const {
  ASSERT_RELEASE(
      span_out.size() == SizeInBytes(), "Destination span size mismatches field element size.");
  coef0_.ToBytes(span_out.subspan(0, BaseFieldElement::SizeInBytes()));
  coef1_.ToBytes(
      span_out.subspan(BaseFieldElement::SizeInBytes(), BaseFieldElement::SizeInBytes()));
}

inline QuadraticExtensionFieldElement QuadraticExtensionFieldElement::FromBytes(
    gsl::span<const std::byte> bytes) {
  ASSERT_RELEASE(bytes.size() == SizeInBytes(), "Source span size mismatches field element size.");
  const BaseFieldElement coef0 =
      BaseFieldElement::FromBytes(bytes.subspan(0, BaseFieldElement::SizeInBytes()));
  return {coef0, BaseFieldElement::FromBytes(bytes.subspan(
                     BaseFieldElement::SizeInBytes(), BaseFieldElement::SizeInBytes()))};
}

inline std::string QuadraticExtensionFieldElement::ToString() const {
  return coef0_.ToString() + "::" + coef1_.ToString();
}

inline QuadraticExtensionFieldElement QuadraticExtensionFieldElement::FromString(
    const std::string& s) {
  const size_t split_point = s.find("::");
  if (split_point == std::string::npos) {
    return QuadraticExtensionFieldElement(BaseFieldElement::FromString(s));
  }
  ASSERT_RELEASE(
      s.find("::", split_point + 2) == std::string::npos,
      "Bad QuadraticExtensionFieldElement format: " + s);
  return {BaseFieldElement::FromString(s.substr(0, split_point)),
          BaseFieldElement::FromString(s.substr(split_point + 2))};
}

}  // namespace airkit
