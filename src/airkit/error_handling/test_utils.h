#ifndef AIRKIT_ERROR_HANDLING_TEST_UTILS_H_
#define AIRKIT_ERROR_HANDLING_TEST_UTILS_H_

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "airkit/error_handling/error_handling.h"

/*
  Expects statement to throw an AirkitException whose message (without the stack trace) matches
  the given gmock matcher.
  Usage:
    EXPECT_ASSERT(Foo(), testing::HasSubstr("must be a power of 2"));
*/
#define EXPECT_ASSERT(statement, matcher)                    \
  EXPECT_THROW(                                              \
      try { statement; } catch (const ::airkit::AirkitException& e) { \
        EXPECT_THAT(e.Message(), matcher);                   \
        throw;                                               \
      },                                                     \
      ::airkit::AirkitException)

#endif  // AIRKIT_ERROR_HANDLING_TEST_UTILS_H_
