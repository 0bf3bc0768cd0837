/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_BALANCE_CALCULATOR_HPP
#define KESSAN_BALANCE_CALCULATOR_HPP

#include <functional>
#include <vector>

#include "books/account_registry.hpp"
#include "books/impl/db_transaction.hpp"
#include "books/journal_store.hpp"
#include "books/opening_balance_store.hpp"
#include "logger/logger_fwd.hpp"
#include "reports/trial_balance.hpp"

namespace kessan {
  namespace reports {

    /**
     * Trial balance and general ledger over the stores. Each report reads
     * from one snapshot transaction.
     */
    class BalanceCalculator {
     public:
      using TodayProvider = std::function<model::Date()>;

      /**
       * @param today - source of the current date, used for the fiscal year
       * of a ledger requested without a start date
       */
      BalanceCalculator(books::AccountRegistry &accounts,
                        books::JournalStore &journal,
                        books::OpeningBalanceStore &openings,
                        books::DatabaseTransaction &tx,
                        logger::LoggerPtr log,
                        TodayProvider today);

      BalanceCalculator(books::AccountRegistry &accounts,
                        books::JournalStore &journal,
                        books::OpeningBalanceStore &openings,
                        books::DatabaseTransaction &tx,
                        logger::LoggerPtr log);

      /**
       * Trial balance of every active account.
       * @param fiscal_year - year whose opening balances are used
       * @param window - reporting window, each missing bound defaults to the
       * fiscal year bound
       */
      model::LedgerResult<std::vector<TrialBalanceRow>> trialBalance(
          model::FiscalYearType fiscal_year, const model::DateRange &window);

      /**
       * Entries of one account with a running balance, seeded from the
       * opening balance of the year of window.start, or of the current year
       * if no start is given.
       * @return NotFoundError for an unknown account
       */
      model::LedgerResult<GeneralLedger> generalLedger(
          model::AccountIdType account_id, const model::DateRange &window);

     private:
      books::AccountRegistry &accounts_;
      books::JournalStore &journal_;
      books::OpeningBalanceStore &openings_;
      books::DatabaseTransaction &tx_;
      logger::LoggerPtr log_;
      TodayProvider today_;
    };

  }  // namespace reports
}  // namespace kessan

#endif  // KESSAN_BALANCE_CALCULATOR_HPP
