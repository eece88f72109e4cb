#include "airkit/air/trace_info.h"

#include <sstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/error_handling/test_utils.h"

namespace airkit {
namespace {

using testing::HasSubstr;

TEST(TraceInfo, Accessors) {
  const TraceInfo trace_info(3, 1024);
  EXPECT_EQ(3U, trace_info.Width());
  EXPECT_EQ(1024U, trace_info.Length());
  EXPECT_EQ(TraceInfo(3, 1024), trace_info);
  EXPECT_NE(TraceInfo(3, 512), trace_info);
  EXPECT_NE(TraceInfo(2, 1024), trace_info);
}

TEST(TraceInfo, Limits) {
  EXPECT_NO_THROW(TraceInfo(TraceInfo::kMaxWidth, TraceInfo::kMinLength));
  EXPECT_ASSERT(TraceInfo(0, 8), HasSubstr("at least 1"));
  EXPECT_ASSERT(TraceInfo(256, 8), HasSubstr("must not exceed 255"));
  EXPECT_ASSERT(TraceInfo(1, 4), HasSubstr("at least 8"));
  EXPECT_ASSERT(TraceInfo(1, 24), HasSubstr("power of 2"));
  EXPECT_ASSERT(TraceInfo(1, UINT64_C(1) << 40), HasSubstr("must not exceed 2^39"));
}

TEST(TraceInfo, ToString) {
  std::stringstream ss;
  ss << TraceInfo(2, 16);
  EXPECT_EQ("TraceInfo(width: 2, length: 16)", ss.str());
}

}  // namespace
}  // namespace airkit
