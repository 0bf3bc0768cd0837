/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "model/date.hpp"

#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"

using namespace kessan::model;

TEST(DateTest, ParsesIsoDate) {
  auto date = parseDate("2024-02-29");
  KESSAN_ASSERT_RESULT_VALUE(date);
  EXPECT_EQ(date.assumeValue(), Date(2024, 2, 29));
  EXPECT_EQ(toIsoString(date.assumeValue()), "2024-02-29");
}

/**
 * @given texts that are not calendar dates in YYYY-MM-DD form
 * @when they are parsed
 * @then each is a validation error
 */
TEST(DateTest, RejectsMalformedDates) {
  for (auto text : {"",
                    "2024-1-01",
                    "2024/01/01",
                    "20240101",
                    "2024-13-01",
                    "2023-02-29",
                    "2024-04-31",
                    "abcd-ef-gh",
                    "2024-01-01T00:00"}) {
    KESSAN_ASSERT_LEDGER_ERROR(parseDate(text), kValidation) << text;
  }
}

TEST(DateTest, FiscalYearBounds) {
  EXPECT_EQ(fiscalYearStart(2024), Date(2024, 1, 1));
  EXPECT_EQ(fiscalYearEnd(2024), Date(2024, 12, 31));
}

TEST(DateTest, ValidateFiscalYear) {
  KESSAN_ASSERT_RESULT_VALUE(validateFiscalYear(1400));
  KESSAN_ASSERT_RESULT_VALUE(validateFiscalYear(9999));
  KESSAN_ASSERT_LEDGER_ERROR(validateFiscalYear(1399), kValidation);
  KESSAN_ASSERT_LEDGER_ERROR(validateFiscalYear(10000), kValidation);
  KESSAN_ASSERT_LEDGER_ERROR(validateFiscalYear(-1), kValidation);
}

TEST(DateTest, ValidateRange) {
  KESSAN_ASSERT_RESULT_VALUE(validateRange({}));
  KESSAN_ASSERT_RESULT_VALUE(
      validateRange({Date(2024, 1, 1), Date(2024, 1, 1)}));
  KESSAN_ASSERT_RESULT_VALUE(validateRange({Date(2024, 5, 1), boost::none}));
  KESSAN_ASSERT_LEDGER_ERROR(
      validateRange({Date(2024, 2, 1), Date(2024, 1, 31)}), kValidation);
}
