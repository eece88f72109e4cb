#ifndef AIRKIT_STL_UTILS_CONTAINERS_H_
#define AIRKIT_STL_UTILS_CONTAINERS_H_

#include <array>
#include <cstddef>
#include <ostream>
#include <vector>

/*
  A fixed array of bytes, e.g. a test seed: MakeByteArray<0xca, 0xfe>().
*/
template <unsigned char... Bytes>
constexpr std::array<std::byte, sizeof...(Bytes)> MakeByteArray() {
  return {std::byte{Bytes}...};
}

namespace std {  // NOLINT: found by argument dependent lookup from any namespace.

/*
  Prints [a, b, c]. Used in assertion messages and test failure output.
*/
template <typename T>
ostream& operator<<(ostream& out, const vector<T>& v) {
  out << "[";
  for (size_t i = 0; i < v.size(); ++i) {
    out << (i == 0 ? "" : ", ") << v[i];
  }
  return out << "]";
}

}  // namespace std

#endif  // AIRKIT_STL_UTILS_CONTAINERS_H_
