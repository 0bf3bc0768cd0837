/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reports/balance_calculator.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <fmt/format.h>
#include "books/impl/transaction_scope.hpp"
#include "common/result_try.hpp"
#include "logger/logger.hpp"

namespace kessan {
  namespace reports {

    using model::LedgerError;
    using model::makeLedgerError;

    BalanceCalculator::BalanceCalculator(books::AccountRegistry &accounts,
                                         books::JournalStore &journal,
                                         books::OpeningBalanceStore &openings,
                                         books::DatabaseTransaction &tx,
                                         logger::LoggerPtr log,
                                         TodayProvider today)
        : accounts_(accounts),
          journal_(journal),
          openings_(openings),
          tx_(tx),
          log_(std::move(log)),
          today_(std::move(today)) {}

    BalanceCalculator::BalanceCalculator(books::AccountRegistry &accounts,
                                         books::JournalStore &journal,
                                         books::OpeningBalanceStore &openings,
                                         books::DatabaseTransaction &tx,
                                         logger::LoggerPtr log)
        : BalanceCalculator(accounts, journal, openings, tx, std::move(log), [] {
            return boost::gregorian::day_clock::local_day();
          }) {}

    model::LedgerResult<std::vector<TrialBalanceRow>>
    BalanceCalculator::trialBalance(model::FiscalYearType fiscal_year,
                                    const model::DateRange &window) {
      KESSAN_EXPECTED_ERROR_CHECK(model::validateFiscalYear(fiscal_year));
      const auto year_start = model::fiscalYearStart(fiscal_year);
      model::DateRange period{window.start.value_or(year_start),
                              window.end.value_or(
                                  model::fiscalYearEnd(fiscal_year))};
      KESSAN_EXPECTED_ERROR_CHECK(model::validateRange(period));

      return books::inTransaction(
          tx_,
          log_,
          "trialBalance",
          [&]() -> model::LedgerResult<std::vector<TrialBalanceRow>> {
            KESSAN_EXPECTED_TRY_GET_VALUE(accounts,
                                          accounts_.listAccounts(true));
            KESSAN_EXPECTED_TRY_GET_VALUE(
                openings, openings_.openingBalances(fiscal_year));
            KESSAN_EXPECTED_TRY_GET_VALUE(movements,
                                          journal_.movementTotals(period));

            books::MovementTotalsMap pre_period;
            if (*period.start > year_start) {
              model::DateRange before{
                  year_start, *period.start - boost::gregorian::days(1)};
              KESSAN_EXPECTED_TRY_GET_VALUE(totals,
                                            journal_.movementTotals(before));
              pre_period = std::move(totals);
            }

            log_->debug("trial balance of {} from {} to {} over {} accounts",
                        fiscal_year,
                        model::toIsoString(*period.start),
                        model::toIsoString(*period.end),
                        accounts.size());
            return expected::makeValue(
                computeTrialBalance(accounts, openings, pre_period, movements));
          },
          books::TransactionMode::kSnapshot);
    }

    model::LedgerResult<GeneralLedger> BalanceCalculator::generalLedger(
        model::AccountIdType account_id, const model::DateRange &window) {
      KESSAN_EXPECTED_ERROR_CHECK(model::validateRange(window));
      const model::FiscalYearType fiscal_year =
          window.start ? window.start->year() : today_().year();

      return books::inTransaction(
          tx_,
          log_,
          "generalLedger",
          [&]() -> model::LedgerResult<GeneralLedger> {
            KESSAN_EXPECTED_TRY_GET_VALUE(account, accounts_.findById(account_id));
            if (not account) {
              return makeLedgerError(
                  LedgerError::Kind::kNotFound,
                  fmt::format("account {} not found", account_id));
            }
            KESSAN_EXPECTED_TRY_GET_VALUE(
                opening, openings_.openingBalance(fiscal_year, account_id));
            KESSAN_EXPECTED_TRY_GET_VALUE(
                entries, journal_.accountEntries(account_id, window));
            return expected::makeValue(buildGeneralLedger(
                std::move(*account), fiscal_year, opening, entries));
          },
          books::TransactionMode::kSnapshot);
    }

  }  // namespace reports
}  // namespace kessan
