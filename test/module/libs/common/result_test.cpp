/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/result.hpp"

#include <gtest/gtest.h>
#include "common/result_try.hpp"
#include "framework/result_gtest_checkers.hpp"

using namespace kessan::expected;

namespace {
  Result<int, std::string> half(int value) {
    if (value % 2 != 0) {
      return makeError(std::string{"odd"});
    }
    return makeValue(value / 2);
  }

  Result<int, std::string> quarter(int value) {
    KESSAN_EXPECTED_TRY_GET_VALUE(once, half(value));
    return half(once);
  }

  Result<void, std::string> checkEven(int value) {
    KESSAN_EXPECTED_ERROR_CHECK(half(value));
    return {};
  }
}  // namespace

TEST(ResultTest, MatchValueAndError) {
  auto value = half(4);
  KESSAN_ASSERT_RESULT_VALUE(value);
  EXPECT_EQ(value.assumeValue(), 2);

  auto error = half(3);
  KESSAN_ASSERT_RESULT_ERROR(error);
  EXPECT_EQ(error.assumeError(), "odd");

  auto described =
      half(3).match([](const auto &v) { return std::to_string(v.value); },
                    [](const auto &e) { return e.error; });
  EXPECT_EQ(described, "odd");
}

/**
 * @given a chain of fallible operations joined by bind
 * @when one of them fails
 * @then the first error is the result and later steps are not invoked
 */
TEST(ResultTest, BindStopsAtFirstError) {
  bool reached = false;
  auto result = half(6) | [&](int v) {
    reached = true;
    return half(v);
  };
  KESSAN_ASSERT_RESULT_ERROR(result);
  EXPECT_TRUE(reached);

  reached = false;
  auto failed = half(5) | [&](int v) {
    reached = true;
    return half(v);
  };
  KESSAN_ASSERT_RESULT_ERROR(failed);
  EXPECT_FALSE(reached);
}

TEST(ResultTest, TryMacrosPropagateErrors) {
  auto ok = quarter(8);
  KESSAN_ASSERT_RESULT_VALUE(ok);
  EXPECT_EQ(ok.assumeValue(), 2);
  KESSAN_ASSERT_RESULT_ERROR(quarter(6));

  KESSAN_ASSERT_RESULT_VALUE(checkEven(2));
  auto error = resultToOptionalError(checkEven(3));
  ASSERT_TRUE(error);
  EXPECT_EQ(*error, "odd");
  auto value = resultToOptionalValue(half(10));
  ASSERT_TRUE(value);
  EXPECT_EQ(*value, 5);
}
