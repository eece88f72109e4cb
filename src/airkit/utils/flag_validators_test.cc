#include "airkit/utils/flag_validators.h"

#include <cstdio>
#include <fstream>
#include <string>

#include "gtest/gtest.h"

namespace airkit {
namespace {

TEST(FlagValidators, InputFile) {
  const std::string file_name = ::testing::TempDir() + "flag_validators_input.json";
  EXPECT_FALSE(ValidateInputFile("input", file_name));
  std::ofstream(file_name) << "{}";
  EXPECT_TRUE(ValidateInputFile("input", file_name));
  std::remove(file_name.c_str());
}

TEST(FlagValidators, OutputFile) {
  const std::string file_name = ::testing::TempDir() + "flag_validators_output.json";
  EXPECT_TRUE(ValidateOutputFile("out", file_name));
  // A validated output file that did not exist is not left behind.
  EXPECT_FALSE(ValidateInputFile("out", file_name));
  EXPECT_FALSE(ValidateOutputFile("out", "/nonexistent_dir/output.json"));
  EXPECT_TRUE(ValidateOptionalOutputFile("out", ""));
  EXPECT_FALSE(ValidateOptionalOutputFile("out", "/nonexistent_dir/output.json"));
}

TEST(FlagValidators, TraceLength) {
  EXPECT_TRUE(ValidateTraceLength("trace_length", 8));
  EXPECT_TRUE(ValidateTraceLength("trace_length", 1024));
  EXPECT_FALSE(ValidateTraceLength("trace_length", 4));
  EXPECT_FALSE(ValidateTraceLength("trace_length", 1000));
  EXPECT_FALSE(ValidateTraceLength("trace_length", 0));
}

}  // namespace
}  // namespace airkit
