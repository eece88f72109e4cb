namespace airkit {

ALWAYS_INLINE CubicExtensionFieldElement CubicExtensionFieldElement::operator*(
    const CubicExtensionFieldElement& rhs) const {
  const BaseFieldElement mul00 = coef0_ * rhs.coef0_;
  const BaseFieldElement mul11 = coef1_ * rhs.coef1_;
  const BaseFieldElement mul22 = coef2_ * rhs.coef2_;

  // Coefficients of phi^1..phi^3 in the unreduced product, by Karatsuba.
  const BaseFieldElement c1 = (coef0_ + coef1_) * (rhs.coef0_ + rhs.coef1_) - mul00 - mul11;
  const BaseFieldElement c2 = (coef0_ + coef2_) * (rhs.coef0_ + rhs.coef2_) - mul00 - mul22 + mul11;
  const BaseFieldElement c3 = (coef1_ + coef2_) * (rhs.coef1_ + rhs.coef2_) - mul11 - mul22;

  // phi^3 = phi + 2 and phi^4 = phi^2 + 2 phi.
  return {
      mul00 + c3 + c3,
      c1 + c3 + mul22 + mul22,
      c2 + mul22,
  };
}

inline CubicExtensionFieldElement CubicExtensionFieldElement::GetFrobenius() const {
  // phi^p and phi^(2p), reduced modulo X^3 - X - 2.
  static const CubicExtensionFieldElement kPhiPowP(
      BaseFieldElement::FromUint(535723389845153157),
      BaseFieldElement::FromUint(2410755254303189206),
      BaseFieldElement::FromUint(1502227412998293433));
  static const CubicExtensionFieldElement kPhiPow2P(
      BaseFieldElement::FromUint(1607170169535459472),
      BaseFieldElement::FromUint(2573674192688599747),
      BaseFieldElement::FromUint(2200869741228857130));
  return CubicExtensionFieldElement(coef0_) + kPhiPowP * coef1_ + kPhiPow2P * coef2_;
}

inline CubicExtensionFieldElement CubicExtensionFieldElement::Inverse() const {
  // 1/z = (z' z'') / norm(z), where z', z'' are the conjugates of z and norm(z) = z z' z'' is in
  // the base field.
  ASSERT_RELEASE(*this != Zero(), "Zero does not have an inverse.");
  const CubicExtensionFieldElement conj1 = GetFrobenius();
  const CubicExtensionFieldElement conj2 = conj1.GetFrobenius();
  const CubicExtensionFieldElement numerator = conj1 * conj2;
  const CubicExtensionFieldElement norm = *this * numerator;
  ASSERT_RELEASE(norm.IsInBaseField(), "Expecting the norm to be a base field element.");
  return numerator * norm.coef0_.Inverse();
}

inline void CubicExtensionFieldElement::ToBytes(gsl::span<std::byte> span_out) const {
  ASSERT_RELEASE(
      span_out.size() == SizeInBytes(), "Destination span size mismatches field element size.");
  const size_t n = BaseFieldElement::SizeInBytes();
  coef0_.ToBytes(span_out.subspan(0, n));
  coef1_.ToBytes(span_out.subspan(n, n));
  coef2_.ToBytes(span_out.subspan(2 * n, n));
}

inline CubicExtensionFieldElement CubicExtensionFieldElement::FromBytes(
    gsl::span<const std::byte> bytes) {
  ASSERT_RELEASE(bytes.size() == SizeInBytes(), "Source span size mismatches field element size.");
  const size_t n = BaseFieldElement::SizeInBytes();
  const BaseFieldElement coef0 = BaseFieldElement::FromBytes(bytes.subspan(0, n));
  const BaseFieldElement coef1 = BaseFieldElement::FromBytes(bytes.subspan(n, n));
  return {coef0, coef1, BaseFieldElement::FromBytes(bytes.subspan(2 * n, n))};
}

inline std::string CubicExtensionFieldElement::ToString() const {
  return coef0_.ToString() + "::" + coef1_.ToString() + "::" + coef2_.ToString();
}

inline CubicExtensionFieldElement CubicExtensionFieldElement::FromString(const std::string& s) {
  const size_t first_split_point = s.find("::");
  if (first_split_point == std::string::npos) {
    return CubicExtensionFieldElement(BaseFieldElement::FromString(s));
  }
  const size_t second_split_point = s.find("::", first_split_point + 2);
  ASSERT_RELEASE(
      second_split_point != std::string::npos, "Bad CubicExtensionFieldElement format: " + s);
  return {
      BaseFieldElement::FromString(s.substr(0, first_split_point)),
      BaseFieldElement::FromString(
          s.substr(first_split_point + 2, second_split_point - first_split_point - 2)),
      BaseFieldElement::FromString(s.substr(second_split_point + 2))};
}

}  // namespace airkit
