namespace airkit {

inline BaseFieldElement BaseFieldElement::Inverse() const {
  ASSERT_RELEASE(*this != BaseFieldElement::Zero(), "Zero does not have an inverse.");
  uint64_t exp = kModulus - 2;
  uint64_t power = value_;
  uint64_t res = kMontgomeryR;
  while (exp != 0) {
    if ((exp & 1) == 1) {
      res = MontgomeryMul(res, power);
    }
    power = MontgomeryMul(power, power);
    exp >>= 1;
  }
  return BaseFieldElement(res);
}

}  // namespace airkit
