/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reports/trial_balance.hpp"

namespace {
  template <typename Map>
  typename Map::mapped_type valueOr(const Map &map,
                                    const typename Map::key_type &key) {
    auto it = map.find(key);
    return it == map.end() ? typename Map::mapped_type{} : it->second;
  }
}  // namespace

namespace kessan {
  namespace reports {

    std::vector<TrialBalanceRow> computeTrialBalance(
        const std::vector<model::Account> &accounts,
        const books::OpeningBalanceMap &openings,
        const books::MovementTotalsMap &pre_period,
        const books::MovementTotalsMap &period) {
      std::vector<TrialBalanceRow> rows;
      rows.reserve(accounts.size());
      for (const auto &account : accounts) {
        const auto side = model::normalSide(account.category);
        const auto pre = valueOr(pre_period, account.id);
        const auto movement = valueOr(period, account.id);

        TrialBalanceRow row;
        row.account_id = account.id;
        row.code = account.code;
        row.name = account.name;
        row.category = account.category;
        row.opening = valueOr(openings, account.id);
        row.carry_forward =
            model::applyMovement(side, row.opening, pre.debit, pre.credit);
        row.debit_total = movement.debit;
        row.credit_total = movement.credit;
        row.closing = model::applyMovement(
            side, row.carry_forward, movement.debit, movement.credit);
        rows.push_back(std::move(row));
      }
      return rows;
    }

    GeneralLedger buildGeneralLedger(
        model::Account account,
        model::FiscalYearType fiscal_year,
        model::AmountType opening_balance,
        const std::vector<model::JournalEntryView> &entries) {
      GeneralLedger ledger;
      const auto side = model::normalSide(account.category);
      const auto account_id = account.id;
      ledger.account = std::move(account);
      ledger.fiscal_year = fiscal_year;
      ledger.opening_balance = opening_balance;

      auto balance = opening_balance;
      ledger.rows.reserve(entries.size());
      for (const auto &view : entries) {
        const auto &entry = view.entry;
        LedgerRow row;
        row.entry_id = entry.id;
        row.date = entry.entry_date;
        if (entry.debit_account_id == account_id) {
          row.debit_amount = entry.amount;
          row.counter_account = view.credit_account_name;
        } else {
          row.credit_amount = entry.amount;
          row.counter_account = view.debit_account_name;
        }
        row.tax_classification = entry.tax_classification;
        row.counterparty = entry.counterparty;
        row.memo = entry.memo;
        balance = model::applyMovement(
            side, balance, row.debit_amount, row.credit_amount);
        row.balance = balance;
        ledger.rows.push_back(std::move(row));
      }
      return ledger;
    }

  }  // namespace reports
}  // namespace kessan
