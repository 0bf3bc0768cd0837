/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_DEPRECIATION_SCHEDULE_HPP
#define KESSAN_DEPRECIATION_SCHEDULE_HPP

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include "model/fixed_asset.hpp"

namespace kessan {
  namespace depreciation {

    /// Book value kept for a fully depreciated asset still in use
    constexpr model::AmountType kMemorandumValue = 1;

    /// Depreciation of one asset in one fiscal year
    struct DepreciationRow {
      model::AssetIdType asset_id{};
      std::string name;
      model::Date acquisition_date;
      model::AmountType acquisition_cost{};
      int useful_life{};
      std::string method;
      model::FiscalYearType fiscal_year{};
      model::AmountType opening_book_value{};
      model::AmountType depreciation{};
      model::AmountType closing_book_value{};
      /// 1 / useful_life
      double annual_rate{};
      /// disposal falling in this fiscal year
      boost::optional<model::DisposalKind> disposal_kind;
      /// sale: proceeds minus book value, retirement: minus book value
      model::AmountType gain_or_loss{};
      std::string remark;
    };

    /// cost - memorandum value
    model::AmountType depreciableBase(const model::FixedAsset &asset);

    /// depreciable base / useful life, rounded down
    model::AmountType annualAmount(const model::FixedAsset &asset);

    /**
     * Depreciation recognized in the fiscal years from acquisition up to,
     * not including, fiscal_year.
     */
    model::AmountType cumulativeBefore(const model::FixedAsset &asset,
                                       model::FiscalYearType fiscal_year);

    /**
     * Straight-line depreciation of the asset in the fiscal year. The
     * acquisition year is prorated by the months from the acquisition month
     * through December, a disposal year by the months in use.
     * @return none if the asset is not held during the year
     */
    boost::optional<DepreciationRow> computeForYear(
        const model::FixedAsset &asset, model::FiscalYearType fiscal_year);

    /**
     * Rows of every fiscal year from acquisition until the book value
     * reaches the memorandum value or the asset is disposed of
     */
    std::vector<DepreciationRow> fullSchedule(const model::FixedAsset &asset);

  }  // namespace depreciation
}  // namespace kessan

#endif  // KESSAN_DEPRECIATION_SCHEDULE_HPP
