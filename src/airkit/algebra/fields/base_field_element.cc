#include "airkit/algebra/fields/base_field_element.h"

#include <array>
#include <cstddef>

#include "airkit/utils/serialization.h"
#include "airkit/utils/to_from_string.h"

namespace airkit {

void BaseFieldElement::ToBytes(gsl::span<std::byte> span_out) const {
  ASSERT_RELEASE(
      span_out.size() == SizeInBytes(), "Destination span size mismatches field element size.");
  Serialize(ToStandardForm(), span_out);
}

BaseFieldElement BaseFieldElement::FromBytes(gsl::span<const std::byte> bytes) {
  ASSERT_RELEASE(
      bytes.size() == SizeInBytes(), "Source span size mismatches field element size, expected " +
                                         std::to_string(SizeInBytes()) + ", got " +
                                         std::to_string(bytes.size()) + ".");
  const uint64_t val = Deserialize(bytes);
  ASSERT_RELEASE(val < kModulus, "Serialized value is not smaller than the field modulus.");
  return FromUint(val);
}

BaseFieldElement BaseFieldElement::FromString(const std::string& s) {
  std::array<std::byte, SizeInBytes()> as_bytes{};
  HexStringToBytes(s, as_bytes);
  const uint64_t val = Deserialize(as_bytes);
  ASSERT_RELEASE(val < kModulus, "Value " + s + " is not smaller than the field modulus.");
  return FromUint(val);
}

std::string BaseFieldElement::ToString() const {
  std::array<std::byte, SizeInBytes()> as_bytes{};
  Serialize(ToStandardForm(), as_bytes);
  return BytesToHexString(as_bytes);
}

uint64_t BaseFieldElement::ToStandardForm() const { return MontgomeryMul(value_, 1); }

BaseFieldElement BaseFieldElement::RandomElement(Prng* prng) {
  // Uniformity is preserved under the Montgomery map, so the sample is used as value_ directly.
  constexpr uint64_t kRelevantBits = Pow2(kModulusBits + 1) - 1;

  std::array<std::byte, SizeInBytes()> bytes{};
  uint64_t sample;
  do {
    prng->GetRandomBytes(bytes);
    sample = Deserialize(bytes) & kRelevantBits;
  } while (sample >= kModulus);

  return BaseFieldElement(sample);
}

}  // namespace airkit
