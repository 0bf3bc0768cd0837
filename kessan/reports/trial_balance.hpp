/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_TRIAL_BALANCE_HPP
#define KESSAN_TRIAL_BALANCE_HPP

#include <string>
#include <vector>

#include "books/journal_store.hpp"
#include "books/opening_balance_store.hpp"
#include "model/account.hpp"
#include "model/date.hpp"
#include "model/journal_entry.hpp"

namespace kessan {
  namespace reports {

    struct TrialBalanceRow {
      model::AccountIdType account_id{};
      std::string code;
      std::string name;
      model::AccountCategory category{model::AccountCategory::kAsset};
      /// stored opening balance of the fiscal year
      model::AmountType opening{};
      /// balance at the start of the window
      model::AmountType carry_forward{};
      model::AmountType debit_total{};
      model::AmountType credit_total{};
      model::AmountType closing{};
    };

    /**
     * Combine per-account figures into trial balance rows, one per account,
     * in the order of accounts.
     * @param accounts - accounts to report
     * @param openings - opening balances of the fiscal year
     * @param pre_period - movements from the fiscal year start to the day
     * before the window
     * @param period - movements inside the window
     */
    std::vector<TrialBalanceRow> computeTrialBalance(
        const std::vector<model::Account> &accounts,
        const books::OpeningBalanceMap &openings,
        const books::MovementTotalsMap &pre_period,
        const books::MovementTotalsMap &period);

    struct LedgerRow {
      model::EntryIdType entry_id{};
      model::Date date;
      /// name of the other leg of the entry
      std::string counter_account;
      model::AmountType debit_amount{};
      model::AmountType credit_amount{};
      model::TaxClassification tax_classification{
          model::TaxClassification::kStandard10};
      std::string counterparty;
      std::string memo;
      /// running balance after this entry
      model::AmountType balance{};
    };

    struct GeneralLedger {
      model::Account account;
      model::FiscalYearType fiscal_year{};
      model::AmountType opening_balance{};
      std::vector<LedgerRow> rows;
    };

    /**
     * Build ledger rows of an account from its entries, which must be in
     * chronological order. The running balance starts from opening_balance.
     */
    GeneralLedger buildGeneralLedger(
        model::Account account,
        model::FiscalYearType fiscal_year,
        model::AmountType opening_balance,
        const std::vector<model::JournalEntryView> &entries);

  }  // namespace reports
}  // namespace kessan

#endif  // KESSAN_TRIAL_BALANCE_HPP
