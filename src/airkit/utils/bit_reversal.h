#ifndef AIRKIT_UTILS_BIT_REVERSAL_H_
#define AIRKIT_UTILS_BIT_REVERSAL_H_

#include <cstddef>
#include <cstdint>

#include "gsl/gsl-lite.hpp"

#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"

namespace airkit {

/*
  Returns n with its lowest number_of_bits bits in reverse order, e.g.
  BitReverse(0b001101, 6) == 0b101100.
*/
inline uint64_t BitReverse(uint64_t n, size_t number_of_bits) {
  ASSERT_RELEASE(number_of_bits <= 64, "A uint64_t has 64 bits.");
  ASSERT_RELEASE(
      number_of_bits == 64 || n < Pow2(number_of_bits), "n must be smaller than 2^number_of_bits.");
  uint64_t res = 0;
  for (size_t i = 0; i < number_of_bits; ++i) {
    res = (res << 1) | ((n >> i) & 1);
  }
  return res;
}

/*
  Permutes src into dst in bit-reversed order: dst[BitReverse(i, log(n))] = src[i]. The radix-2
  FFT consumes its input in this order.
*/
template <typename FieldElementT>
void BitReverseVector(gsl::span<const FieldElementT> src, gsl::span<FieldElementT> dst) {
  ASSERT_RELEASE(src.size() == dst.size(), "Span sizes of src and dst must be similar.");
  const size_t log_n = SafeLog2(src.size());
  for (size_t i = 0; i < src.size(); ++i) {
    dst[BitReverse(i, log_n)] = src[i];
  }
}

}  // namespace airkit

#endif  // AIRKIT_UTILS_BIT_REVERSAL_H_
