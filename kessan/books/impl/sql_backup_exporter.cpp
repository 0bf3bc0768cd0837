/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "books/impl/sql_backup_exporter.hpp"

#include <boost/tuple/tuple.hpp>
#include <soci/boost-tuple.h>
#include "books/impl/sql_utils.hpp"
#include "books/impl/transaction_scope.hpp"
#include "common/result_try.hpp"
#include "logger/logger.hpp"

namespace kessan {
  namespace books {

    SqlBackupExporter::SqlBackupExporter(soci::session &sql,
                                         AccountRegistry &accounts,
                                         logger::LoggerPtr log)
        : sql_(sql), accounts_(accounts), tx_(sql), log_(std::move(log)) {}

    std::vector<model::JournalEntry> SqlBackupExporter::journalEntries() {
      SqlBigint id = 0;
      std::string entry_date;
      SqlBigint debit_account_id = 0;
      SqlBigint credit_account_id = 0;
      SqlBigint amount = 0;
      std::string tax_classification;
      SqlBigint tax_amount = 0;
      model::JournalEntry entry;
      int is_deleted = 0;
      soci::statement statement =
          (sql_.prepare << "SELECT id, entry_date, debit_account_id, "
                           "credit_account_id, amount, tax_classification, "
                           "tax_amount, counterparty, memo, evidence_url, "
                           "source, is_deleted FROM journal_entries ORDER BY id",
           soci::into(id),
           soci::into(entry_date),
           soci::into(debit_account_id),
           soci::into(credit_account_id),
           soci::into(amount),
           soci::into(tax_classification),
           soci::into(tax_amount),
           soci::into(entry.counterparty),
           soci::into(entry.memo),
           soci::into(entry.evidence_url),
           soci::into(entry.source),
           soci::into(is_deleted));
      statement.execute();

      std::vector<model::JournalEntry> entries;
      while (statement.fetch()) {
        entry.id = id;
        entry.entry_date = storedDate(entry_date);
        entry.debit_account_id = debit_account_id;
        entry.credit_account_id = credit_account_id;
        entry.amount = amount;
        entry.tax_classification = storedClassification(tax_classification);
        entry.tax_amount = tax_amount;
        entry.is_deleted = is_deleted != 0;
        entries.push_back(entry);
      }
      return entries;
    }

    std::vector<model::YearOpeningBalance>
    SqlBackupExporter::openingBalances() {
      using T = boost::tuple<int, SqlBigint, SqlBigint, std::string>;
      soci::rowset<T> rowset =
          (sql_.prepare << "SELECT fiscal_year, account_id, amount, note "
                           "FROM opening_balances "
                           "ORDER BY fiscal_year, account_id");

      std::vector<model::YearOpeningBalance> balances;
      for (const auto &row : rowset) {
        model::YearOpeningBalance balance;
        balance.fiscal_year = row.get<0>();
        balance.balance.account_id = row.get<1>();
        balance.balance.amount = row.get<2>();
        balance.balance.note = row.get<3>();
        balances.push_back(std::move(balance));
      }
      return balances;
    }

    std::vector<model::Counterparty> SqlBackupExporter::counterparties() {
      using T = boost::tuple<SqlBigint,
                             std::string,
                             std::string,
                             std::string,
                             std::string,
                             int>;
      soci::rowset<T> rowset =
          (sql_.prepare << "SELECT id, name, code, contact_info, notes, "
                           "is_active FROM counterparties ORDER BY id");

      std::vector<model::Counterparty> counterparties;
      for (const auto &row : rowset) {
        model::Counterparty counterparty;
        counterparty.id = row.get<0>();
        counterparty.name = row.get<1>();
        counterparty.code = row.get<2>();
        counterparty.contact_info = row.get<3>();
        counterparty.notes = row.get<4>();
        counterparty.is_active = row.get<5>() != 0;
        counterparties.push_back(std::move(counterparty));
      }
      return counterparties;
    }

    model::LedgerResult<model::BooksBackup> SqlBackupExporter::exportBackup() {
      return inTransaction(
          tx_,
          log_,
          "exportBackup",
          [&]() -> model::LedgerResult<model::BooksBackup> {
            model::BooksBackup backup;
            KESSAN_EXPECTED_TRY_GET_VALUE(accounts,
                                          accounts_.listAccounts(false));
            backup.accounts = std::move(accounts);
            backup.journal_entries = journalEntries();
            backup.opening_balances = openingBalances();
            backup.counterparties = counterparties();
            log_->info(
                "exported {} accounts, {} journal entries, {} opening "
                "balances, {} counterparties",
                backup.accounts.size(),
                backup.journal_entries.size(),
                backup.opening_balances.size(),
                backup.counterparties.size());
            return expected::makeValue(std::move(backup));
          },
          TransactionMode::kSnapshot);
    }

  }  // namespace books
}  // namespace kessan
