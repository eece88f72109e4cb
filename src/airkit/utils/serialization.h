#ifndef AIRKIT_UTILS_SERIALIZATION_H_
#define AIRKIT_UTILS_SERIALIZATION_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/error_handling/error_handling.h"

namespace airkit {

/*
  Big-endian encoding of 64-bit integers, used wherever integers are mixed into hashes (public
  seeds, hash chain counters) and for field element bytes.
*/

inline void Serialize(uint64_t val, gsl::span<std::byte> span_out) {
  ASSERT_RELEASE(
      span_out.size() == sizeof(uint64_t), "Destination span size mismatches uint64_t size.");
  for (size_t i = sizeof(uint64_t); i > 0; --i) {
    span_out[i - 1] = static_cast<std::byte>(val & 0xff);
    val >>= 8;
  }
}

inline uint64_t Deserialize(gsl::span<const std::byte> span) {
  ASSERT_RELEASE(span.size() == sizeof(uint64_t), "Source span size mismatches uint64_t size.");
  uint64_t val = 0;
  for (const std::byte b : span) {
    val = (val << 8) | std::to_integer<uint64_t>(b);
  }
  return val;
}

/*
  Appends the 8 byte encoding of val to *bytes.
*/
inline void AppendSerialized(uint64_t val, std::vector<std::byte>* bytes) {
  bytes->resize(bytes->size() + sizeof(uint64_t));
  Serialize(val, gsl::make_span(*bytes).last(sizeof(uint64_t)));
}

}  // namespace airkit

#endif  // AIRKIT_UTILS_SERIALIZATION_H_
