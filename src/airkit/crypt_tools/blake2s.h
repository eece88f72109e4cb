#ifndef AIRKIT_CRYPT_TOOLS_BLAKE2S_H_
#define AIRKIT_CRYPT_TOOLS_BLAKE2S_H_

#include <array>
#include <cstddef>
#include <iostream>
#include <string>

#include "gsl/gsl-lite.hpp"

namespace airkit {

/*
  A BLAKE2s digest of DigestNumBytes bytes (BLAKE2s supports 1..32).
*/
template <size_t DigestNumBytes>
class Blake2s {
 public:
  static_assert(DigestNumBytes > 0 && DigestNumBytes <= 32, "Unsupported BLAKE2s digest size.");
  static constexpr size_t kDigestNumBytes = DigestNumBytes;

  /*
    An uninitialized digest, to be filled by HashBytesWithLength().
  */
  Blake2s() {}  // NOLINT

  static Blake2s HashBytesWithLength(gsl::span<const std::byte> bytes);

  bool operator==(const Blake2s& other) const { return buffer_ == other.buffer_; }
  bool operator!=(const Blake2s& other) const { return !(*this == other); }

  const std::array<std::byte, kDigestNumBytes>& GetDigest() const { return buffer_; }
  std::string ToString() const;

 private:
  std::array<std::byte, kDigestNumBytes> buffer_;
};

using Blake2s256 = Blake2s<32>;

template <size_t DigestNumBytes>
std::ostream& operator<<(std::ostream& out, const Blake2s<DigestNumBytes>& hash) {
  return out << hash.ToString();
}

}  // namespace airkit

#include "airkit/crypt_tools/blake2s.inl"

#endif  // AIRKIT_CRYPT_TOOLS_BLAKE2S_H_
