#ifndef AIRKIT_ALGEBRA_FIELDS_CUBIC_EXTENSION_FIELD_ELEMENT_H_
#define AIRKIT_ALGEBRA_FIELDS_CUBIC_EXTENSION_FIELD_ELEMENT_H_

#include <string>

#include "airkit/algebra/field_element_base.h"
#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  An element coef0_ + coef1_ * phi + coef2_ * phi^2 of the degree 3 extension F[X]/(X^3 - X - 2),
  where F is the field of BaseFieldElement.
*/
class CubicExtensionFieldElement : public FieldElementBase<CubicExtensionFieldElement> {
 public:
#ifdef NDEBUG
  CubicExtensionFieldElement() = default;
#else
  CubicExtensionFieldElement() = delete;
#endif

  constexpr CubicExtensionFieldElement(
      const BaseFieldElement& coef0, const BaseFieldElement& coef1, const BaseFieldElement& coef2)
      : coef0_(coef0), coef1_(coef1), coef2_(coef2) {}

  explicit constexpr CubicExtensionFieldElement(const BaseFieldElement& coef0)
      : coef0_(coef0), coef1_(BaseFieldElement::Zero()), coef2_(BaseFieldElement::Zero()) {}

  static constexpr CubicExtensionFieldElement Zero() {
    return CubicExtensionFieldElement(BaseFieldElement::Zero());
  }

  static constexpr CubicExtensionFieldElement One() {
    return CubicExtensionFieldElement(BaseFieldElement::One());
  }

  static CubicExtensionFieldElement Uninitialized() { return Zero(); }

  static constexpr CubicExtensionFieldElement FromUint(uint64_t val) {
    return CubicExtensionFieldElement(BaseFieldElement::FromUint(val));
  }

  static constexpr CubicExtensionFieldElement FromBaseField(const BaseFieldElement& val) {
    return CubicExtensionFieldElement(val);
  }

  CubicExtensionFieldElement operator+(const CubicExtensionFieldElement& rhs) const {
    return {coef0_ + rhs.coef0_, coef1_ + rhs.coef1_, coef2_ + rhs.coef2_};
  }
  CubicExtensionFieldElement operator+(const BaseFieldElement& rhs) const {
    return {coef0_ + rhs, coef1_, coef2_};
  }

  CubicExtensionFieldElement operator-(const CubicExtensionFieldElement& rhs) const {
    return {coef0_ - rhs.coef0_, coef1_ - rhs.coef1_, coef2_ - rhs.coef2_};
  }
  CubicExtensionFieldElement operator-(const BaseFieldElement& rhs) const {
    return {coef0_ - rhs, coef1_, coef2_};
  }
  CubicExtensionFieldElement operator-() const { return {-coef0_, -coef1_, -coef2_}; }

  CubicExtensionFieldElement operator*(const CubicExtensionFieldElement& rhs) const;
  CubicExtensionFieldElement operator*(const BaseFieldElement& rhs) const {
    return {coef0_ * rhs, coef1_ * rhs, coef2_ * rhs};
  }

  using FieldElementBase<CubicExtensionFieldElement>::operator+=;
  using FieldElementBase<CubicExtensionFieldElement>::operator*=;
  using FieldElementBase<CubicExtensionFieldElement>::operator/;
  CubicExtensionFieldElement operator/(const BaseFieldElement& rhs) const {
    return *this * rhs.Inverse();
  }

  constexpr bool operator==(const CubicExtensionFieldElement& rhs) const {
    return coef0_ == rhs.coef0_ && coef1_ == rhs.coef1_ && coef2_ == rhs.coef2_;
  }

  /*
    Returns z^kModulus.
  */
  CubicExtensionFieldElement GetFrobenius() const;

  CubicExtensionFieldElement Inverse() const;

  static CubicExtensionFieldElement RandomElement(Prng* prng) {
    const BaseFieldElement coef0 = BaseFieldElement::RandomElement(prng);
    const BaseFieldElement coef1 = BaseFieldElement::RandomElement(prng);
    return {coef0, coef1, BaseFieldElement::RandomElement(prng)};
  }

  bool IsInBaseField() const {
    return coef1_ == BaseFieldElement::Zero() && coef2_ == BaseFieldElement::Zero();
  }

  const BaseFieldElement& Coef0() const { return coef0_; }
  const BaseFieldElement& Coef1() const { return coef1_; }
  const BaseFieldElement& Coef2() const { return coef2_; }

  void ToBytes(gsl::span<std::byte> span_out) const;
  static CubicExtensionFieldElement FromBytes(gsl::span<const std::byte> bytes);

  /*
    Format: "<coef0>::<coef1>::<coef2>". A single base field string is also accepted by FromString.
  */
  std::string ToString() const;
  static CubicExtensionFieldElement FromString(const std::string& s);

  static constexpr size_t SizeInBytes() { return BaseFieldElement::SizeInBytes() * 3; }
  static constexpr size_t ExtensionDegree() { return 3; }

 private:
  BaseFieldElement coef0_;
  BaseFieldElement coef1_;
  BaseFieldElement coef2_;
};

inline CubicExtensionFieldElement operator*(
    const BaseFieldElement& lhs, const CubicExtensionFieldElement& rhs) {
  return rhs * lhs;
}

inline CubicExtensionFieldElement operator+(
    const BaseFieldElement& lhs, const CubicExtensionFieldElement& rhs) {
  return rhs + lhs;
}

inline CubicExtensionFieldElement operator-(
    const BaseFieldElement& lhs, const CubicExtensionFieldElement& rhs) {
  return -rhs + lhs;
}

}  // namespace airkit

#include "airkit/algebra/fields/cubic_extension_field_element.inl"

#endif  // AIRKIT_ALGEBRA_FIELDS_CUBIC_EXTENSION_FIELD_ELEMENT_H_
