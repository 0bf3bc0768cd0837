/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_DEPRECIATION_SCHEDULER_HPP
#define KESSAN_DEPRECIATION_SCHEDULER_HPP

#include <vector>

#include "books/fixed_asset_register.hpp"
#include "books/impl/db_transaction.hpp"
#include "depreciation/depreciation_schedule.hpp"
#include "logger/logger_fwd.hpp"

namespace kessan {
  namespace depreciation {

    class DepreciationScheduler {
     public:
      DepreciationScheduler(books::FixedAssetRegister &assets,
                            books::DatabaseTransaction &tx,
                            logger::LoggerPtr log);

      /// Rows of every asset held during the fiscal year
      model::LedgerResult<std::vector<DepreciationRow>> compute(
          model::FiscalYearType fiscal_year);

      /// Whole-life schedule of one asset
      model::LedgerResult<std::vector<DepreciationRow>> schedule(
          model::AssetIdType asset_id);

     private:
      books::FixedAssetRegister &assets_;
      books::DatabaseTransaction &tx_;
      logger::LoggerPtr log_;
    };

  }  // namespace depreciation
}  // namespace kessan

#endif  // KESSAN_DEPRECIATION_SCHEDULER_HPP
