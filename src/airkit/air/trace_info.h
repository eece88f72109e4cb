#ifndef AIRKIT_AIR_TRACE_INFO_H_
#define AIRKIT_AIR_TRACE_INFO_H_

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  The shape of an execution trace: the number of columns (registers) and the number of rows
  (steps). The trace domain is the multiplicative subgroup of size Length(), so the length must be
  a power of 2.
*/
class TraceInfo {
 public:
  static constexpr size_t kMinWidth = 1;
  static constexpr size_t kMaxWidth = 255;
  static constexpr uint64_t kMinLength = 8;
  static constexpr uint64_t kMaxLength = UINT64_C(1) << BaseFieldElement::kTwoAdicity;

  TraceInfo(size_t width, uint64_t length);

  size_t Width() const { return width_; }
  uint64_t Length() const { return length_; }

  bool operator==(const TraceInfo& other) const {
    return width_ == other.width_ && length_ == other.length_;
  }
  bool operator!=(const TraceInfo& other) const { return !(*this == other); }

  std::string ToString() const;

 private:
  size_t width_;
  uint64_t length_;
};

inline std::ostream& operator<<(std::ostream& out, const TraceInfo& trace_info) {
  return out << trace_info.ToString();
}

}  // namespace airkit

#endif  // AIRKIT_AIR_TRACE_INFO_H_
