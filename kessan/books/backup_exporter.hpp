/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_BACKUP_EXPORTER_HPP
#define KESSAN_BACKUP_EXPORTER_HPP

#include "model/backup.hpp"
#include "model/ledger_error.hpp"

namespace kessan {
  namespace books {

    class BackupExporter {
     public:
      virtual ~BackupExporter() = default;

      /// Read all records of the books from one snapshot
      virtual model::LedgerResult<model::BooksBackup> exportBackup() = 0;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_BACKUP_EXPORTER_HPP
