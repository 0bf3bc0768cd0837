/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "depreciation/depreciation_schedule.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace {
  using kessan::model::AmountType;
  using kessan::model::FiscalYearType;

  constexpr AmountType kMonthsPerYear = 12;

  /// Months from the acquisition month through December
  AmountType acquisitionYearMonths(const kessan::model::FixedAsset &asset) {
    return 13 - asset.acquisition_date.month();
  }

  FiscalYearType yearOf(const kessan::model::Date &date) {
    return date.year();
  }

  /// Depreciation of a year without disposal, before the cap
  AmountType scheduledAmount(const kessan::model::FixedAsset &asset,
                             FiscalYearType fiscal_year,
                             AmountType annual) {
    if (fiscal_year == yearOf(asset.acquisition_date)) {
      return annual * acquisitionYearMonths(asset) / kMonthsPerYear;
    }
    return annual;
  }

  /**
   * Row of a year in which the asset is held, given the depreciation
   * recognized before it
   */
  boost::optional<kessan::depreciation::DepreciationRow> yearRow(
      const kessan::model::FixedAsset &asset,
      FiscalYearType fiscal_year,
      AmountType cumulative_before) {
    using kessan::model::DisposalKind;

    const auto acquisition_year = yearOf(asset.acquisition_date);
    const bool disposed_this_year =
        asset.disposal and yearOf(asset.disposal->date) == fiscal_year;
    if (acquisition_year > fiscal_year
        or (asset.disposal and yearOf(asset.disposal->date) < fiscal_year)) {
      return boost::none;
    }

    const auto base = kessan::depreciation::depreciableBase(asset);
    const auto annual = kessan::depreciation::annualAmount(asset);

    kessan::depreciation::DepreciationRow row;
    row.asset_id = asset.id;
    row.name = asset.name;
    row.acquisition_date = asset.acquisition_date;
    row.acquisition_cost = asset.acquisition_cost;
    row.useful_life = asset.useful_life;
    row.method = asset.method;
    row.fiscal_year = fiscal_year;
    row.annual_rate = 1.0 / asset.useful_life;
    row.opening_book_value = asset.acquisition_cost - cumulative_before;

    if (cumulative_before >= base and not disposed_this_year) {
      row.depreciation = 0;
      row.closing_book_value = row.opening_book_value;
      return row;
    }

    if (disposed_this_year) {
      const auto &disposal = *asset.disposal;
      const AmountType disposal_month = disposal.date.month();
      const AmountType months_used = acquisition_year == fiscal_year
          ? std::max<AmountType>(
              disposal_month - asset.acquisition_date.month() + 1, 1)
          : disposal_month;
      row.depreciation = std::min(annual * months_used / kMonthsPerYear,
                                  base - cumulative_before);
      const auto book_value = row.opening_book_value - row.depreciation;
      row.closing_book_value = 0;
      row.disposal_kind = disposal.kind;
      if (disposal.kind == DisposalKind::kRetirement) {
        row.gain_or_loss = -book_value;
        row.remark = book_value <= kessan::depreciation::kMemorandumValue
            ? std::string{"除却（償却済）"}
            : fmt::format("除却損 {}", book_value);
      } else {
        row.gain_or_loss = disposal.proceeds - book_value;
        row.remark = fmt::format(
            "売却額 {} 売却損益 {:+}", disposal.proceeds, row.gain_or_loss);
      }
      return row;
    }

    row.depreciation =
        std::min(scheduledAmount(asset, fiscal_year, annual),
                 base - cumulative_before);
    row.closing_book_value = row.opening_book_value - row.depreciation;
    return row;
  }
}  // namespace

namespace kessan {
  namespace depreciation {

    model::AmountType depreciableBase(const model::FixedAsset &asset) {
      return asset.acquisition_cost - kMemorandumValue;
    }

    model::AmountType annualAmount(const model::FixedAsset &asset) {
      return depreciableBase(asset) / asset.useful_life;
    }

    model::AmountType cumulativeBefore(const model::FixedAsset &asset,
                                       model::FiscalYearType fiscal_year) {
      const auto base = depreciableBase(asset);
      const auto annual = annualAmount(asset);
      model::AmountType cumulative = 0;
      for (auto year = yearOf(asset.acquisition_date);
           year < fiscal_year and cumulative < base;
           ++year) {
        cumulative +=
            std::min(scheduledAmount(asset, year, annual), base - cumulative);
      }
      return cumulative;
    }

    boost::optional<DepreciationRow> computeForYear(
        const model::FixedAsset &asset, model::FiscalYearType fiscal_year) {
      return yearRow(asset, fiscal_year, cumulativeBefore(asset, fiscal_year));
    }

    std::vector<DepreciationRow> fullSchedule(const model::FixedAsset &asset) {
      std::vector<DepreciationRow> rows;
      const auto acquisition_year = yearOf(asset.acquisition_date);
      model::AmountType cumulative = 0;
      for (auto year = acquisition_year;; ++year) {
        auto row = yearRow(asset, year, cumulative);
        if (not row) {
          break;
        }
        cumulative += row->depreciation;
        // a recorded disposal ends the schedule in its own year, otherwise
        // the memorandum value does; an annual amount of zero never reaches it
        const bool last = asset.disposal
            ? bool(row->disposal_kind)
            : row->closing_book_value <= kMemorandumValue
                or (year > acquisition_year and row->depreciation == 0);
        rows.push_back(std::move(*row));
        if (last) {
          break;
        }
      }
      return rows;
    }

  }  // namespace depreciation
}  // namespace kessan
