/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "books/impl/sql_opening_balance_store.hpp"

#include <fmt/format.h>
#include "books/impl/sql_utils.hpp"
#include "books/impl/transaction_scope.hpp"
#include "logger/logger.hpp"

namespace kessan {
  namespace books {

    using model::LedgerError;
    using model::makeLedgerError;

    SqlOpeningBalanceStore::SqlOpeningBalanceStore(soci::session &sql,
                                                   logger::LoggerPtr log)
        : sql_(sql), tx_(sql), log_(std::move(log)) {}

    model::LedgerResult<model::AmountType>
    SqlOpeningBalanceStore::openingBalance(model::FiscalYearType fiscal_year,
                                           model::AccountIdType account_id) {
      return guardedQuery(
          log_, "openingBalance", [&]() -> model::LedgerResult<model::AmountType> {
            SqlBigint id = account_id;
            SqlBigint amount = 0;
            soci::indicator ind = soci::i_null;
            sql_ << "SELECT amount FROM opening_balances "
                    "WHERE fiscal_year = :fiscal_year AND account_id = :id",
                soci::use(fiscal_year, "fiscal_year"), soci::use(id, "id"),
                soci::into(amount, ind);
            if (not sql_.got_data() or ind != soci::i_ok) {
              return expected::makeValue(model::AmountType{0});
            }
            return expected::makeValue(model::AmountType{amount});
          });
    }

    model::LedgerResult<OpeningBalanceMap>
    SqlOpeningBalanceStore::openingBalances(model::FiscalYearType fiscal_year) {
      return guardedQuery(
          log_, "openingBalances", [&]() -> model::LedgerResult<OpeningBalanceMap> {
            SqlBigint account_id = 0;
            SqlBigint amount = 0;
            soci::statement statement =
                (sql_.prepare << "SELECT account_id, amount FROM "
                                 "opening_balances WHERE fiscal_year = "
                                 ":fiscal_year",
                 soci::into(account_id),
                 soci::into(amount),
                 soci::use(fiscal_year, "fiscal_year"));
            statement.execute();

            OpeningBalanceMap balances;
            while (statement.fetch()) {
              balances[account_id] = amount;
            }
            return expected::makeValue(std::move(balances));
          });
    }

    model::LedgerResult<std::vector<model::OpeningBalanceView>>
    SqlOpeningBalanceStore::listOpeningBalances(
        model::FiscalYearType fiscal_year) {
      return guardedQuery(
          log_,
          "listOpeningBalances",
          [&]() -> model::LedgerResult<std::vector<model::OpeningBalanceView>> {
            SqlBigint account_id = 0;
            std::string code;
            std::string name;
            std::string category;
            SqlBigint amount = 0;
            std::string note;
            soci::statement statement =
                (sql_.prepare << R"(
SELECT am.id, am.code, am.name, am.account_type,
       COALESCE(ob.amount, 0), COALESCE(ob.note, '')
FROM accounts_master am
LEFT JOIN opening_balances ob
       ON ob.account_id = am.id AND ob.fiscal_year = :fiscal_year
WHERE am.is_active = 1
ORDER BY am.display_order, am.code)",
                 soci::into(account_id),
                 soci::into(code),
                 soci::into(name),
                 soci::into(category),
                 soci::into(amount),
                 soci::into(note),
                 soci::use(fiscal_year, "fiscal_year"));
            statement.execute();

            std::vector<model::OpeningBalanceView> views;
            while (statement.fetch()) {
              views.push_back(model::OpeningBalanceView{account_id,
                                                        code,
                                                        name,
                                                        storedCategory(category),
                                                        amount,
                                                        note});
            }
            return expected::makeValue(std::move(views));
          });
    }

    model::LedgerResult<void> SqlOpeningBalanceStore::saveOpeningBalances(
        model::FiscalYearType fiscal_year,
        const std::vector<model::OpeningBalance> &balances) {
      return inTransaction(
          tx_, log_, "saveOpeningBalances", [&]() -> model::LedgerResult<void> {
            for (const auto &balance : balances) {
              SqlBigint account_id = balance.account_id;
              int found = 0;
              sql_ << "SELECT COUNT(*) FROM accounts_master WHERE id = :id",
                  soci::use(account_id, "id"), soci::into(found);
              if (found == 0) {
                return makeLedgerError(
                    LedgerError::Kind::kValidation,
                    fmt::format("opening balance for unknown account {}",
                                balance.account_id));
              }
              SqlBigint amount = balance.amount;
              sql_ << "INSERT INTO opening_balances "
                      "(fiscal_year, account_id, amount, note) "
                      "VALUES (:fiscal_year, :account_id, :amount, :note) "
                      "ON CONFLICT (fiscal_year, account_id) DO UPDATE "
                      "SET amount = excluded.amount, note = excluded.note",
                  soci::use(fiscal_year, "fiscal_year"),
                  soci::use(account_id, "account_id"),
                  soci::use(amount, "amount"),
                  soci::use(balance.note, "note");
            }
            log_->debug("saved {} opening balances of {}",
                        balances.size(),
                        fiscal_year);
            return expected::makeValue();
          });
    }

  }  // namespace books
}  // namespace kessan
