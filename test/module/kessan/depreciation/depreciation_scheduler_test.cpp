/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "depreciation/depreciation_scheduler.hpp"

#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_logger.hpp"
#include "module/kessan/books/mock_db_transaction.hpp"
#include "module/kessan/books/mock_fixed_asset_register.hpp"

using namespace kessan;
using namespace kessan::model;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

namespace {
  FixedAsset makeAsset(AssetIdType id,
                       std::string name,
                       Date acquired,
                       AmountType cost,
                       int useful_life) {
    FixedAsset asset;
    asset.id = id;
    asset.name = std::move(name);
    asset.acquisition_date = acquired;
    asset.acquisition_cost = cost;
    asset.useful_life = useful_life;
    return asset;
  }
}  // namespace

class DepreciationSchedulerTest : public ::testing::Test {
 public:
  void SetUp() override {
    scheduler_ = std::make_unique<depreciation::DepreciationScheduler>(
        assets_, tx_, getTestLogger("DepreciationScheduler"));
    laptop_ = makeAsset(1, "ノートPC", Date(2020, 4, 10), 600001, 5);
    desk_ = makeAsset(2, "デスク", Date(2026, 1, 10), 80000, 8);
  }

 protected:
  ::testing::StrictMock<books::MockFixedAssetRegister> assets_;
  ::testing::StrictMock<books::MockDatabaseTransaction> tx_;
  std::unique_ptr<depreciation::DepreciationScheduler> scheduler_;
  FixedAsset laptop_;
  FixedAsset desk_;
};

/**
 * @given a laptop held in 2025 and a desk acquired in 2026
 * @when depreciation of fiscal year 2025 is computed
 * @then only the laptop has a row, read inside one snapshot
 */
TEST_F(DepreciationSchedulerTest, ComputeSkipsAssetsNotHeld) {
  InSequence seq;
  EXPECT_CALL(tx_, beginSnapshot());
  EXPECT_CALL(assets_, listAssets())
      .WillOnce(Return(expected::makeValue(
          std::vector<FixedAsset>{laptop_, desk_})));
  EXPECT_CALL(tx_, commit());

  auto rows = scheduler_->compute(2025);
  KESSAN_ASSERT_RESULT_VALUE(rows);
  ASSERT_EQ(rows.assumeValue().size(), 1u);
  const auto &row = rows.assumeValue().front();
  EXPECT_EQ(row.asset_id, 1);
  EXPECT_EQ(row.fiscal_year, 2025);
  EXPECT_EQ(row.depreciation, 30000);
  EXPECT_EQ(row.closing_book_value, 1);
}

/**
 * @given a sold laptop
 * @when depreciation of the year of sale and of the year after is computed
 * @then the sale year carries the disposal, the year after has no row
 */
TEST_F(DepreciationSchedulerTest, ComputeDisposalYear) {
  Disposal sale;
  sale.kind = DisposalKind::kSale;
  sale.date = Date(2022, 6, 30);
  sale.proceeds = 300000;
  laptop_.disposal = sale;

  EXPECT_CALL(tx_, beginSnapshot()).Times(2);
  EXPECT_CALL(assets_, listAssets())
      .Times(2)
      .WillRepeatedly(
          Return(expected::makeValue(std::vector<FixedAsset>{laptop_})));
  EXPECT_CALL(tx_, commit()).Times(2);

  auto sale_year = scheduler_->compute(2022);
  KESSAN_ASSERT_RESULT_VALUE(sale_year);
  ASSERT_EQ(sale_year.assumeValue().size(), 1u);
  const auto &row = sale_year.assumeValue().front();
  ASSERT_TRUE(row.disposal_kind);
  EXPECT_EQ(*row.disposal_kind, DisposalKind::kSale);
  EXPECT_EQ(row.closing_book_value, 0);

  auto after = scheduler_->compute(2023);
  KESSAN_ASSERT_RESULT_VALUE(after);
  EXPECT_TRUE(after.assumeValue().empty());
}

/**
 * @given a laptop with a five year useful life
 * @when its schedule is requested
 * @then rows run from the acquisition year down to the memorandum value
 */
TEST_F(DepreciationSchedulerTest, ScheduleOfAsset) {
  InSequence seq;
  EXPECT_CALL(tx_, beginSnapshot());
  EXPECT_CALL(assets_, getAsset(1)).WillOnce(Return(expected::makeValue(laptop_)));
  EXPECT_CALL(tx_, commit());

  auto rows = scheduler_->schedule(1);
  KESSAN_ASSERT_RESULT_VALUE(rows);
  const auto &schedule = rows.assumeValue();
  ASSERT_EQ(schedule.size(), 6u);
  EXPECT_EQ(schedule.front().fiscal_year, 2020);
  EXPECT_EQ(schedule.front().depreciation, 90000);
  EXPECT_EQ(schedule.back().fiscal_year, 2025);
  EXPECT_EQ(schedule.back().closing_book_value, 1);
}

/**
 * @given no asset with the requested id
 * @when its schedule is requested
 * @then NotFound is reported and the snapshot is rolled back
 */
TEST_F(DepreciationSchedulerTest, ScheduleOfUnknownAsset) {
  InSequence seq;
  EXPECT_CALL(tx_, beginSnapshot());
  EXPECT_CALL(assets_, getAsset(7))
      .WillOnce(Return(
          makeLedgerError(LedgerError::Kind::kNotFound, "fixed asset 7 not found")));
  EXPECT_CALL(tx_, rollback());

  KESSAN_ASSERT_LEDGER_ERROR(scheduler_->schedule(7), kNotFound);
}

/**
 * @given a fiscal year without calendar dates
 * @when depreciation is computed
 * @then a validation error is returned and the register is not read
 */
TEST_F(DepreciationSchedulerTest, ComputeRejectsYearOutsideCalendar) {
  KESSAN_ASSERT_LEDGER_ERROR(scheduler_->compute(10000), kValidation);
}

/**
 * @given a register failing with an exception
 * @when depreciation is computed
 * @then Storage is reported and the snapshot is rolled back
 */
TEST_F(DepreciationSchedulerTest, StorageFailure) {
  InSequence seq;
  EXPECT_CALL(tx_, beginSnapshot());
  EXPECT_CALL(assets_, listAssets())
      .WillOnce(Throw(std::runtime_error("connection lost")));
  EXPECT_CALL(tx_, rollback());

  KESSAN_ASSERT_LEDGER_ERROR(scheduler_->compute(2025), kStorage);
}
