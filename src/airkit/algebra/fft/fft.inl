#include "airkit/algebra/field_operations.h"
#include "airkit/math/math.h"
#include "airkit/utils/bit_reversal.h"

namespace airkit {

namespace fft {
namespace details {

/*
  In-place radix-2 FFT over the subgroup generated by generator. The input is in bit-reversed order
  and the output is in natural order.
*/
template <typename FieldElementT>
void FftInPlaceReverseToNatural(
    gsl::span<FieldElementT> values, const BaseFieldElement& generator) {
  const size_t n = values.size();
  const size_t log_n = SafeLog2(n);
  for (size_t layer = 0; layer < log_n; ++layer) {
    const size_t half_block = Pow2(layer);
    const BaseFieldElement layer_generator = Pow(generator, Pow2(log_n - 1 - layer));
    for (size_t block = 0; block < n; block += 2 * half_block) {
      BaseFieldElement x = BaseFieldElement::One();
      for (size_t j = block; j < block + half_block; ++j) {
        const FieldElementT left = values[j];
        const FieldElementT x_times_right = values[j + half_block] * x;
        values[j] = left + x_times_right;
        values[j + half_block] = left - x_times_right;
        x *= layer_generator;
      }
    }
  }
}

}  // namespace details
}  // namespace fft

template <typename FieldElementT>
void Fft(
    gsl::span<const FieldElementT> src, gsl::span<FieldElementT> dst,
    const BaseFieldElement& generator, const BaseFieldElement& offset) {
  ASSERT_RELEASE(src.size() == dst.size(), "Span sizes of src and dst must be similar.");
  ASSERT_RELEASE(
      Pow(generator, src.size()) == BaseFieldElement::One(),
      "The generator does not match the size of the input.");
  // P(offset * x) has coefficients src[i] * offset^i.
  std::vector<FieldElementT> scaled = FieldElementT::UninitializedVector(src.size());
  BaseFieldElement offset_power = BaseFieldElement::One();
  for (size_t i = 0; i < src.size(); ++i) {
    scaled[i] = src[i] * offset_power;
    offset_power *= offset;
  }
  BitReverseVector<FieldElementT>(scaled, dst);
  fft::details::FftInPlaceReverseToNatural(dst, generator);
}

template <typename FieldElementT>
void Ifft(
    gsl::span<const FieldElementT> src, gsl::span<FieldElementT> dst,
    const BaseFieldElement& generator, const BaseFieldElement& offset) {
  ASSERT_RELEASE(src.size() == dst.size(), "Span sizes of src and dst must be similar.");
  ASSERT_RELEASE(
      Pow(generator, src.size()) == BaseFieldElement::One(),
      "The generator does not match the size of the input.");
  BitReverseVector<FieldElementT>(src, dst);
  fft::details::FftInPlaceReverseToNatural(dst, generator.Inverse());
  // Undo the scaling of the coset, and divide by n.
  const BaseFieldElement n_inverse = BaseFieldElement::FromUint(src.size()).Inverse();
  const BaseFieldElement offset_inverse = offset.Inverse();
  BaseFieldElement factor = n_inverse;
  for (size_t i = 0; i < dst.size(); ++i) {
    dst[i] = dst[i] * factor;
    factor *= offset_inverse;
  }
}

}  // namespace airkit
