#ifndef AIRKIT_ALGEBRA_FIELDS_BASE_FIELD_ELEMENT_H_
#define AIRKIT_ALGEBRA_FIELDS_BASE_FIELD_ELEMENT_H_

#include <array>
#include <string>

#include "airkit/algebra/field_element_base.h"
#include "airkit/math/math.h"
#include "airkit/randomness/prng.h"

namespace airkit {

/*
  The prime field of order p = 2^62 - 111 * 2^39 + 1, over which traces and constraints are
  defined. The multiplicative group has a subgroup of order 2^39, which bounds the trace length.

  The elements fit in one 64 bit word, and are stored in Montgomery representation for faster
  modular multiplication. See https://en.wikipedia.org/wiki/Montgomery_modular_multiplication .
*/
class BaseFieldElement : public FieldElementBase<BaseFieldElement> {
 public:
  static constexpr uint64_t kModulus = 0x3fffc88000000001;  // 2**62 - 111 * 2**39 + 1.
  static constexpr uint64_t kModulusBits = Log2Floor(kModulus);
  static constexpr uint64_t kMontgomeryR = 0xddfffffffffc;  // = 2^64 % kModulus.
  static constexpr uint64_t kMontgomeryRSquared = 0x8bfc9fcfded6444;
  static constexpr uint64_t kMontgomeryRCubed = 0xa2c1532a9535dc7;
  static constexpr uint64_t kMontgomeryMPrime = 0x3fffc87fffffffff;  // = (-(kModulus^-1)) mod 2^64.
  // Log2 of the largest power of 2 dividing kModulus - 1.
  static constexpr size_t kTwoAdicity = 39;

#ifdef NDEBUG
  // The default constructor is allowed only in Release builds, to reduce the allocation time of
  // vectors of field elements.
  BaseFieldElement() = default;
#else
  BaseFieldElement() = delete;
#endif

  static constexpr BaseFieldElement Zero() { return BaseFieldElement(0); }

  static constexpr BaseFieldElement One() { return BaseFieldElement(kMontgomeryR); }

  static BaseFieldElement Uninitialized() { return Zero(); }

  static constexpr BaseFieldElement FromUint(uint64_t val) {
    // MontgomeryMul divides by r, hence the multiplication by r^2.
    return BaseFieldElement(MontgomeryMul(val, kMontgomeryRSquared));
  }

  /*
    Lets generic code embed base field values in any field type.
  */
  static constexpr BaseFieldElement FromBaseField(const BaseFieldElement& val) { return val; }

  BaseFieldElement operator+(const BaseFieldElement& rhs) const {
    return BaseFieldElement(ReduceIfNeeded(value_ + rhs.value_));
  }

  BaseFieldElement operator-(const BaseFieldElement& rhs) const {
    uint64_t val = value_ - rhs.value_;
    return BaseFieldElement(IsNegative(val) ? val + kModulus : val);
  }

  BaseFieldElement operator-() const { return Zero() - *this; }

  BaseFieldElement operator*(const BaseFieldElement& rhs) const {
    return BaseFieldElement(MontgomeryMul(value_, rhs.value_));
  }

  constexpr bool operator==(const BaseFieldElement& rhs) const { return value_ == rhs.value_; }

  /*
    Computes the inverse as x^(kModulus - 2).
  */
  BaseFieldElement Inverse() const;

  void ToBytes(gsl::span<std::byte> span_out) const;

  static BaseFieldElement FromBytes(gsl::span<const std::byte> bytes);

  /*
    Draws a uniformly distributed element by rejection sampling.
  */
  static BaseFieldElement RandomElement(Prng* prng);

  /*
    Parses a "0x"-prefixed hex string holding a value smaller than kModulus.
  */
  static BaseFieldElement FromString(const std::string& s);

  std::string ToString() const;

  uint64_t ToStandardForm() const;

  /*
    Returns a generator of the multiplicative group of the field.
  */
  static constexpr BaseFieldElement Generator() { return BaseFieldElement::FromUint(3); }

  /*
    Returns the prime factors of the size of the multiplicative group (kModulus - 1).
  */
  static constexpr std::array<uint64_t, 4> PrimeFactors() { return {2, 13, 17, 37957}; }

  static constexpr uint64_t FieldSize() { return kModulus; }
  static constexpr size_t SizeInBytes() { return sizeof(uint64_t); }
  static constexpr size_t ExtensionDegree() { return 1; }

 private:
  explicit constexpr BaseFieldElement(uint64_t val) : value_(val) {}

  // kModulus < 2^62, so values below 2 * kModulus never set the sign bit.
  static constexpr bool IsNegative(uint64_t val) { return static_cast<int64_t>(val) < 0; }

  /*
    Maps val in [0, 2 * kModulus) to [0, kModulus).
  */
  static constexpr uint64_t ReduceIfNeeded(uint64_t val) {
    uint64_t alt_val = val - kModulus;
    return IsNegative(alt_val) ? val : alt_val;
  }

  static constexpr __uint128_t Umul128(uint64_t x, uint64_t y) {
    return static_cast<__uint128_t>(x) * static_cast<__uint128_t>(y);
  }

  /*
    Computes (x*y / (2^64)) mod kModulus.
  */
  static constexpr uint64_t MontgomeryMul(uint64_t x, uint64_t y) {
    __uint128_t mul_res = Umul128(x, y);
    uint64_t u = static_cast<uint64_t>(mul_res) * kMontgomeryMPrime;
    __uint128_t res = Umul128(kModulus, u) + mul_res;

    ASSERT_DEBUG(static_cast<uint64_t>(res) == 0, "Low 64bit should be 0.");

    return ReduceIfNeeded(static_cast<uint64_t>(res >> 64));
  }

  uint64_t value_ = 0;
};

}  // namespace airkit

#include "airkit/algebra/fields/base_field_element.inl"

#endif  // AIRKIT_ALGEBRA_FIELDS_BASE_FIELD_ELEMENT_H_
