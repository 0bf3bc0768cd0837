/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_BACKUP_HPP
#define KESSAN_MODEL_BACKUP_HPP

#include <vector>

#include "model/account.hpp"
#include "model/counterparty.hpp"
#include "model/journal_entry.hpp"
#include "model/opening_balance.hpp"
#include "model/types.hpp"

namespace kessan {
  namespace model {

    struct YearOpeningBalance {
      FiscalYearType fiscal_year{};
      OpeningBalance balance;
    };

    /**
     * Every stored record of the books, inactive accounts and counterparties
     * and soft-deleted entries included
     */
    struct BooksBackup {
      std::vector<Account> accounts;
      std::vector<JournalEntry> journal_entries;
      std::vector<YearOpeningBalance> opening_balances;
      std::vector<Counterparty> counterparties;
    };

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_BACKUP_HPP
