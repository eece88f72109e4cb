#ifndef AIRKIT_UTILS_TO_FROM_STRING_H_
#define AIRKIT_UTILS_TO_FROM_STRING_H_

#include <cstddef>
#include <string>

#include "gsl/gsl-lite.hpp"

namespace airkit {

/*
  Converts an array of bytes to a "0x"-prefixed hex string, optionally trimming leading zeros.
  Example: [00, 2B, AA, 10] -> "0x2baa10".
*/
std::string BytesToHexString(gsl::span<const std::byte> data, bool trim_leading_zeros = true);

/*
  Parses a "0x"-prefixed hex string into as_bytes_out, big-endian. Missing leading bytes are set to
  zero.
  Example: "0x2BAA10" -> [00, 2B, AA, 10] (assuming as_bytes_out.size() == 4).
*/
void HexStringToBytes(const std::string& hex_string, gsl::span<std::byte> as_bytes_out);

}  // namespace airkit

#endif  // AIRKIT_UTILS_TO_FROM_STRING_H_
