#include "airkit/utils/to_from_string.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "airkit/error_handling/error_handling.h"

namespace airkit {

namespace {

int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  ASSERT_RELEASE(
      lower >= 'a' && lower <= 'f', std::string("Invalid hex digit '") + c + "'.");
  return 10 + (lower - 'a');
}

}  // namespace

std::string BytesToHexString(gsl::span<const std::byte> data, bool trim_leading_zeros) {
  ASSERT_RELEASE(!data.empty(), "Cannot convert empty byte sequence to hex.");
  std::stringstream s;
  auto iter = data.begin();
  s << "0x";
  if (trim_leading_zeros) {
    for (; iter != data.end() && std::to_integer<int>(*iter) == 0; ++iter) {
    }
    if (iter == data.end()) {
      return "0x0";
    }
    // The most significant byte is written without padding.
    s << std::hex << std::to_integer<int>(*iter);
    ++iter;
  }

  for (; iter != data.end(); ++iter) {
    s << std::setfill('0') << std::setw(2) << std::hex << std::to_integer<int>(*iter);
  }

  return s.str();
}

void HexStringToBytes(const std::string& hex_string, gsl::span<std::byte> as_bytes_out) {
  ASSERT_RELEASE(
      hex_string.length() > 2 && hex_string.compare(0, 2, "0x") == 0,
      "String (\"" + hex_string + "\") must start with '0x' followed by hex digits.");
  std::string digits = hex_string.substr(2);
  digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));
  if (digits.length() % 2 != 0) {
    digits.insert(0, 1, '0');
  }

  const size_t n_bytes = digits.length() / 2;
  ASSERT_RELEASE(
      as_bytes_out.size() >= n_bytes, "Output's length (" + std::to_string(as_bytes_out.size()) +
                                          ") is too short for " + std::to_string(n_bytes) +
                                          " bytes.");
  const size_t offset = as_bytes_out.size() - n_bytes;
  std::fill(as_bytes_out.begin(), as_bytes_out.begin() + offset, std::byte{0});
  for (size_t i = 0; i < n_bytes; ++i) {
    as_bytes_out[offset + i] =
        std::byte(HexDigitValue(digits[2 * i]) * 16 + HexDigitValue(digits[2 * i + 1]));
  }
}

}  // namespace airkit
