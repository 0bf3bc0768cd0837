/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_SQL_BACKUP_EXPORTER_HPP
#define KESSAN_SQL_BACKUP_EXPORTER_HPP

#include "books/backup_exporter.hpp"

#include <soci/soci.h>
#include "books/account_registry.hpp"
#include "books/impl/sql_db_transaction.hpp"
#include "logger/logger_fwd.hpp"

namespace kessan {
  namespace books {

    class SqlBackupExporter : public BackupExporter {
     public:
      /**
       * @param accounts - registry read for the accounts, on the same session
       */
      SqlBackupExporter(soci::session &sql,
                        AccountRegistry &accounts,
                        logger::LoggerPtr log);

      model::LedgerResult<model::BooksBackup> exportBackup() override;

     private:
      std::vector<model::JournalEntry> journalEntries();
      std::vector<model::YearOpeningBalance> openingBalances();
      std::vector<model::Counterparty> counterparties();

      soci::session &sql_;
      AccountRegistry &accounts_;
      SqlDbTransaction tx_;
      logger::LoggerPtr log_;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_SQL_BACKUP_EXPORTER_HPP
