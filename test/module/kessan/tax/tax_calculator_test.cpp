/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tax/tax_calculator.hpp"

#include <gtest/gtest.h>

using kessan::model::AmountType;
using kessan::model::TaxClassification;
using kessan::tax::calculateTaxAmount;
using kessan::tax::taxRate;

static const TaxClassification kAllClassifications[] = {
    TaxClassification::kStandard10,
    TaxClassification::kReduced8,
    TaxClassification::kNonTaxable,
    TaxClassification::kOutOfScope};

TEST(TaxCalculatorTest, RateTable) {
  EXPECT_EQ(taxRate(TaxClassification::kStandard10), 10);
  EXPECT_EQ(taxRate(TaxClassification::kReduced8), 8);
  EXPECT_EQ(taxRate(TaxClassification::kNonTaxable), 0);
  EXPECT_EQ(taxRate(TaxClassification::kOutOfScope), 0);
}

/**
 * @given tax-inclusive 10800 at the reduced rate
 * @when the tax component is extracted
 * @then it is 800
 */
TEST(TaxCalculatorTest, ReducedRateExample) {
  EXPECT_EQ(calculateTaxAmount(10800, TaxClassification::kReduced8), 800);
}

TEST(TaxCalculatorTest, StandardRateRoundsDown) {
  EXPECT_EQ(calculateTaxAmount(11000, TaxClassification::kStandard10), 1000);
  // 1000 * 10 / 110 = 90.9...
  EXPECT_EQ(calculateTaxAmount(1000, TaxClassification::kStandard10), 90);
  EXPECT_EQ(calculateTaxAmount(1, TaxClassification::kStandard10), 0);
}

TEST(TaxCalculatorTest, ZeroRatedClassificationsHaveNoTax) {
  EXPECT_EQ(calculateTaxAmount(123456, TaxClassification::kNonTaxable), 0);
  EXPECT_EQ(calculateTaxAmount(123456, TaxClassification::kOutOfScope), 0);
}

/**
 * @given amounts over a wide range
 * @when the tax is computed for every classification
 * @then it stays within [0, amount] and does not decrease with the rate
 */
TEST(TaxCalculatorTest, BoundedAndMonotonicInRate) {
  for (AmountType amount : {0L, 1L, 9L, 108L, 110L, 999L, 10800L, 987654321L}) {
    for (auto classification : kAllClassifications) {
      auto tax = calculateTaxAmount(amount, classification);
      EXPECT_GE(tax, 0) << amount;
      EXPECT_LE(tax, amount) << amount;
    }
    EXPECT_LE(calculateTaxAmount(amount, TaxClassification::kNonTaxable),
              calculateTaxAmount(amount, TaxClassification::kReduced8));
    EXPECT_LE(calculateTaxAmount(amount, TaxClassification::kReduced8),
              calculateTaxAmount(amount, TaxClassification::kStandard10));
  }
}
