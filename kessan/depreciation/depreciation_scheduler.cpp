/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "depreciation/depreciation_scheduler.hpp"

#include "books/impl/transaction_scope.hpp"
#include "common/result_try.hpp"
#include "logger/logger.hpp"
#include "model/date.hpp"

namespace kessan {
  namespace depreciation {

    DepreciationScheduler::DepreciationScheduler(
        books::FixedAssetRegister &assets,
        books::DatabaseTransaction &tx,
        logger::LoggerPtr log)
        : assets_(assets), tx_(tx), log_(std::move(log)) {}

    model::LedgerResult<std::vector<DepreciationRow>>
    DepreciationScheduler::compute(model::FiscalYearType fiscal_year) {
      KESSAN_EXPECTED_ERROR_CHECK(model::validateFiscalYear(fiscal_year));
      return books::inTransaction(
          tx_,
          log_,
          "depreciation",
          [&]() -> model::LedgerResult<std::vector<DepreciationRow>> {
            KESSAN_EXPECTED_TRY_GET_VALUE(assets, assets_.listAssets());
            std::vector<DepreciationRow> rows;
            for (const auto &asset : assets) {
              if (auto row = computeForYear(asset, fiscal_year)) {
                rows.push_back(std::move(*row));
              }
            }
            log_->debug("depreciation of {}: {} of {} assets held",
                        fiscal_year,
                        rows.size(),
                        assets.size());
            return expected::makeValue(std::move(rows));
          },
          books::TransactionMode::kSnapshot);
    }

    model::LedgerResult<std::vector<DepreciationRow>>
    DepreciationScheduler::schedule(model::AssetIdType asset_id) {
      return books::inTransaction(
          tx_,
          log_,
          "depreciationSchedule",
          [&]() -> model::LedgerResult<std::vector<DepreciationRow>> {
            KESSAN_EXPECTED_TRY_GET_VALUE(asset, assets_.getAsset(asset_id));
            return expected::makeValue(fullSchedule(asset));
          },
          books::TransactionMode::kSnapshot);
    }

  }  // namespace depreciation
}  // namespace kessan
