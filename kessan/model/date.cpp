/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "model/date.hpp"

#include <cctype>
#include <stdexcept>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <fmt/core.h>

namespace {
  constexpr size_t kIsoDateLength = 10;

  bool isIsoDateShape(std::string_view text) {
    if (text.size() != kIsoDateLength or text[4] != '-' or text[7] != '-') {
      return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
      if (i == 4 or i == 7) {
        continue;
      }
      if (not std::isdigit(static_cast<unsigned char>(text[i]))) {
        return false;
      }
    }
    return true;
  }

  int toNumber(std::string_view digits) {
    int number = 0;
    for (auto c : digits) {
      number = number * 10 + (c - '0');
    }
    return number;
  }
}  // namespace

namespace kessan {
  namespace model {

    LedgerResult<Date> parseDate(std::string_view text) {
      if (not isIsoDateShape(text)) {
        return makeLedgerError(
            LedgerError::Kind::kValidation,
            fmt::format("malformed date '{}', expected YYYY-MM-DD", text));
      }
      try {
        return Date(toNumber(text.substr(0, 4)),
                    toNumber(text.substr(5, 2)),
                    toNumber(text.substr(8, 2)));
      } catch (const std::out_of_range &e) {
        return makeLedgerError(
            LedgerError::Kind::kValidation,
            fmt::format("invalid date '{}': {}", text, e.what()));
      }
    }

    std::string toIsoString(const Date &date) {
      return boost::gregorian::to_iso_extended_string(date);
    }

    LedgerResult<void> validateFiscalYear(FiscalYearType fiscal_year) {
      const FiscalYearType first = (boost::gregorian::greg_year::min)();
      const FiscalYearType last = (boost::gregorian::greg_year::max)();
      if (fiscal_year < first or fiscal_year > last) {
        return makeLedgerError(
            LedgerError::Kind::kValidation,
            fmt::format("fiscal year {} is outside {}..{}",
                        fiscal_year,
                        first,
                        last));
      }
      return {};
    }

    Date fiscalYearStart(FiscalYearType fiscal_year) {
      return Date(fiscal_year, boost::gregorian::Jan, 1);
    }

    Date fiscalYearEnd(FiscalYearType fiscal_year) {
      return Date(fiscal_year, boost::gregorian::Dec, 31);
    }

    LedgerResult<void> validateRange(const DateRange &range) {
      if (range.start and range.end and *range.start > *range.end) {
        return makeLedgerError(
            LedgerError::Kind::kValidation,
            fmt::format("start date {} is after end date {}",
                        toIsoString(*range.start),
                        toIsoString(*range.end)));
      }
      return {};
    }

  }  // namespace model
}  // namespace kessan
