#include "airkit/randomness/hash_chain.h"

#include <algorithm>
#include <array>

#include "airkit/utils/serialization.h"

namespace airkit {

HashChain::HashChain(gsl::span<const std::byte> seed)
    : hash_(Blake2s256::HashBytesWithLength(seed)) {}

void HashChain::ResetStream() {
  spare_offset_ = Blake2s256::kDigestNumBytes;
  counter_ = 0;
}

void HashChain::GetRandomBytes(gsl::span<std::byte> random_bytes_out) {
  size_t written = 0;
  while (written < random_bytes_out.size()) {
    if (spare_offset_ == Blake2s256::kDigestNumBytes) {
      const auto& block = HashWithCounter(hash_, counter_++).GetDigest();
      std::copy(block.begin(), block.end(), spare_bytes_.begin());
      spare_offset_ = 0;
    }
    const size_t n_bytes = std::min(
        random_bytes_out.size() - written, Blake2s256::kDigestNumBytes - spare_offset_);
    std::copy(
        spare_bytes_.begin() + spare_offset_, spare_bytes_.begin() + spare_offset_ + n_bytes,
        random_bytes_out.begin() + written);
    spare_offset_ += n_bytes;
    written += n_bytes;
  }
}

void HashChain::UpdateHashChain(gsl::span<const std::byte> raw_bytes) {
  std::vector<std::byte> mixed_bytes(raw_bytes.size() + Blake2s256::kDigestNumBytes);
  std::copy(hash_.GetDigest().begin(), hash_.GetDigest().end(), mixed_bytes.begin());
  std::copy(raw_bytes.begin(), raw_bytes.end(), mixed_bytes.begin() + Blake2s256::kDigestNumBytes);
  hash_ = Blake2s256::HashBytesWithLength(mixed_bytes);
  ResetStream();
}

Blake2s256 HashChain::HashWithCounter(const Blake2s256& hash, uint64_t counter) {
  std::array<std::byte, 2 * Blake2s256::kDigestNumBytes> data{};
  std::copy(hash.GetDigest().begin(), hash.GetDigest().end(), data.begin());
  // The counter occupies the last 8 bytes of the buffer.
  Serialize(counter, gsl::make_span(data).subspan(data.size() - sizeof(uint64_t)));
  return Blake2s256::HashBytesWithLength(data);
}

}  // namespace airkit
