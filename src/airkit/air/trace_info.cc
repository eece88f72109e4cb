#include "airkit/air/trace_info.h"

#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"

namespace airkit {

TraceInfo::TraceInfo(size_t width, uint64_t length) : width_(width), length_(length) {
  ASSERT_RELEASE(width_ >= kMinWidth, "Trace width must be at least 1.");
  ASSERT_RELEASE(
      width_ <= kMaxWidth, "Trace width must not exceed " + std::to_string(kMaxWidth) +
                               ", got " + std::to_string(width_) + ".");
  ASSERT_RELEASE(
      IsPowerOfTwo(length_),
      "Trace length must be a power of 2, got " + std::to_string(length_) + ".");
  ASSERT_RELEASE(
      length_ >= kMinLength, "Trace length must be at least " + std::to_string(kMinLength) +
                                 ", got " + std::to_string(length_) + ".");
  ASSERT_RELEASE(
      length_ <= kMaxLength, "Trace length must not exceed 2^" +
                                 std::to_string(BaseFieldElement::kTwoAdicity) + ".");
}

std::string TraceInfo::ToString() const {
  return "TraceInfo(width: " + std::to_string(width_) + ", length: " + std::to_string(length_) +
         ")";
}

}  // namespace airkit
