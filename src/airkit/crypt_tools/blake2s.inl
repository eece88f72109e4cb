#include <blake2.h>

#include "airkit/error_handling/error_handling.h"
#include "airkit/utils/to_from_string.h"

namespace airkit {

template <size_t DigestNumBytes>
Blake2s<DigestNumBytes> Blake2s<DigestNumBytes>::HashBytesWithLength(
    gsl::span<const std::byte> bytes) {
  Blake2s result;
  blake2s_state ctx;
  ASSERT_RELEASE(blake2s_init(&ctx, kDigestNumBytes) == 0, "blake2s_init failed.");
  ASSERT_RELEASE(blake2s_update(&ctx, bytes.data(), bytes.size()) == 0, "blake2s_update failed.");
  ASSERT_RELEASE(
      blake2s_final(&ctx, gsl::make_span(result.buffer_).template as_span<uint8_t>().data(),
                    kDigestNumBytes) == 0,
      "blake2s_final failed.");
  return result;
}

template <size_t DigestNumBytes>
std::string Blake2s<DigestNumBytes>::ToString() const {
  return BytesToHexString(buffer_, /*trim_leading_zeros=*/false);
}

}  // namespace airkit
