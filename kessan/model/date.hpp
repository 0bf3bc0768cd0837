/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_DATE_HPP
#define KESSAN_MODEL_DATE_HPP

#include <string>
#include <string_view>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/optional.hpp>

#include "model/ledger_error.hpp"
#include "model/types.hpp"

namespace kessan {
  namespace model {

    using Date = boost::gregorian::date;

    /**
     * Parse a strict ISO calendar date `YYYY-MM-DD`.
     * @return the date or ValidationError naming the offending text
     */
    LedgerResult<Date> parseDate(std::string_view text);

    /// Format as `YYYY-MM-DD`, the storage representation
    std::string toIsoString(const Date &date);

    /// ValidationError if no calendar date exists in the fiscal year
    LedgerResult<void> validateFiscalYear(FiscalYearType fiscal_year);

    /// January 1 of the fiscal year
    Date fiscalYearStart(FiscalYearType fiscal_year);

    /// December 31 of the fiscal year
    Date fiscalYearEnd(FiscalYearType fiscal_year);

    /// Closed interval of dates, each bound optional
    struct DateRange {
      boost::optional<Date> start;
      boost::optional<Date> end;
    };

    /// ValidationError if both bounds are present and start is after end
    LedgerResult<void> validateRange(const DateRange &range);

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_DATE_HPP
