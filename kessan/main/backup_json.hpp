/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_BACKUP_JSON_HPP
#define KESSAN_BACKUP_JSON_HPP

#include <string>

#include "model/backup.hpp"

namespace kessan {
  namespace main {

    /**
     * Serialize a backup as a JSON object with one array of records per
     * table: accounts_master, journal_entries, opening_balances and
     * counterparties. Column names are those of the tables.
     */
    std::string backupToJson(const model::BooksBackup &backup);

  }  // namespace main
}  // namespace kessan

#endif  // KESSAN_BACKUP_JSON_HPP
