#ifndef AIRKIT_ALGEBRA_FIELDS_QUADRATIC_EXTENSION_FIELD_ELEMENT_H_
#define AIRKIT_ALGEBRA_FIELDS_QUADRATIC_EXTENSION_FIELD_ELEMENT_H_

#include <string>

#include "airkit/algebra/field_element_base.h"
#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  An element coef0_ + coef1_ * phi of the degree 2 extension F[X]/(X^2 - X - 1), where F is the
  field of BaseFieldElement. X^2 - X - 1 is irreducible over F since 5 is not a square mod
  kModulus.
*/
class QuadraticExtensionFieldElement : public FieldElementBase<QuadraticExtensionFieldElement> {
 public:
#ifdef NDEBUG
  QuadraticExtensionFieldElement() = default;
#else
  QuadraticExtensionFieldElement() = delete;
#endif

  constexpr QuadraticExtensionFieldElement(
      const BaseFieldElement& coef0, const BaseFieldElement& coef1)
      : coef0_(coef0), coef1_(coef1) {}

  explicit constexpr QuadraticExtensionFieldElement(const BaseFieldElement& coef0)
      : coef0_(coef0), coef1_(BaseFieldElement::Zero()) {}

  static constexpr QuadraticExtensionFieldElement Zero() {
    return QuadraticExtensionFieldElement(BaseFieldElement::Zero());
  }

  static constexpr QuadraticExtensionFieldElement One() {
    return QuadraticExtensionFieldElement(BaseFieldElement::One());
  }

  static QuadraticExtensionFieldElement Uninitialized() { return Zero(); }

  static constexpr QuadraticExtensionFieldElement FromUint(uint64_t val) {
    return QuadraticExtensionFieldElement(BaseFieldElement::FromUint(val));
  }

  static constexpr QuadraticExtensionFieldElement FromBaseField(const BaseFieldElement& val) {
    return QuadraticExtensionFieldElement(val);
  }

  QuadraticExtensionFieldElement operator+(const QuadraticExtensionFieldElement& rhs) const {
    return {coef0_ + rhs.coef0_, coef1_ + rhs.coef1_};
  }
  QuadraticExtensionFieldElement operator+(const BaseFieldElement& rhs) const {
    return {coef0_ + rhs, coef1_};
  }

  QuadraticExtensionFieldElement operator-(const QuadraticExtensionFieldElement& rhs) const {
    return {coef0_ - rhs.coef0_, coef1_ - rhs.coef1_};
  }
  QuadraticExtensionFieldElement operator-(const BaseFieldElement& rhs) const {
    return {coef0_ - rhs, coef1_};
  }
  QuadraticExtensionFieldElement operator-() const { return {-coef0_, -coef1_}; }

  QuadraticExtensionFieldElement operator*(const QuadraticExtensionFieldElement& rhs) const;
  QuadraticExtensionFieldElement operator*(const BaseFieldElement& rhs) const {
    return {coef0_ * rhs, coef1_ * rhs};
  }

  using FieldElementBase<QuadraticExtensionFieldElement>::operator+=;
  using FieldElementBase<QuadraticExtensionFieldElement>::operator*=;
  using FieldElementBase<QuadraticExtensionFieldElement>::operator/;
  QuadraticExtensionFieldElement operator/(const BaseFieldElement& rhs) const {
    return *this * rhs.Inverse();
  }

  constexpr bool operator==(const QuadraticExtensionFieldElement& rhs) const {
    return coef0_ == rhs.coef0_ && coef1_ == rhs.coef1_;
  }

  /*
    Returns the image under the non-trivial automorphism, phi -> 1 - phi.
  */
  QuadraticExtensionFieldElement Conjugate() const { return {coef0_ + coef1_, -coef1_}; }

  QuadraticExtensionFieldElement Inverse() const;

  static QuadraticExtensionFieldElement RandomElement(Prng* prng) {
    const BaseFieldElement coef0 = BaseFieldElement::RandomElement(prng);
    return {coef0, BaseFieldElement::RandomElement(prng)};
  }

  bool IsInBaseField() const { return coef1_ == BaseFieldElement::Zero(); }

  const BaseFieldElement& Coef0() const { return coef0_; }
  const BaseFieldElement& Coef1() const { return coef1_; }

  /*
    Writes coef0_ followed by coef1_.
  */
  void ToBytes(gsl::span<std::byte> span_out) const;
  static QuadraticExtensionFieldElement FromBytes(gsl::span<const std::byte> bytes);

  /*
    Format: "<coef0>::<coef1>". A single base field string is also accepted by FromString.
  */
  std::string ToString() const;
  static QuadraticExtensionFieldElement FromString(const std::string& s);

  static constexpr size_t SizeInBytes() { return BaseFieldElement::SizeInBytes() * 2; }
  static constexpr size_t ExtensionDegree() { return 2; }

 private:
  BaseFieldElement coef0_;
  BaseFieldElement coef1_;
};

inline QuadraticExtensionFieldElement operator*(
    const BaseFieldElement& lhs, const QuadraticExtensionFieldElement& rhs) {
  return rhs * lhs;
}

inline QuadraticExtensionFieldElement operator+(
    const BaseFieldElement& lhs, const QuadraticExtensionFieldElement& rhs) {
  return rhs + lhs;
}

inline QuadraticExtensionFieldElement operator-(
    const BaseFieldElement& lhs, const QuadraticExtensionFieldElement& rhs) {
  return -rhs + lhs;
}

}  // namespace airkit

#include "airkit/algebra/fields/quadratic_extension_field_element.inl"

#endif  // AIRKIT_ALGEBRA_FIELDS_QUADRATIC_EXTENSION_FIELD_ELEMENT_H_
