/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_OPENING_BALANCE_STORE_HPP
#define KESSAN_OPENING_BALANCE_STORE_HPP

#include <unordered_map>
#include <vector>

#include "model/ledger_error.hpp"
#include "model/opening_balance.hpp"

namespace kessan {
  namespace books {

    using OpeningBalanceMap =
        std::unordered_map<model::AccountIdType, model::AmountType>;

    class OpeningBalanceStore {
     public:
      virtual ~OpeningBalanceStore() = default;

      /// @return stored opening balance, 0 if none is stored
      virtual model::LedgerResult<model::AmountType> openingBalance(
          model::FiscalYearType fiscal_year, model::AccountIdType account_id) = 0;

      /// @return stored balances of the year by account
      virtual model::LedgerResult<OpeningBalanceMap> openingBalances(
          model::FiscalYearType fiscal_year) = 0;

      /**
       * Every active account with its stored balance of the year, 0 and an
       * empty note if absent, in registry order
       */
      virtual model::LedgerResult<std::vector<model::OpeningBalanceView>>
      listOpeningBalances(model::FiscalYearType fiscal_year) = 0;

      /// Upsert all rows atomically
      virtual model::LedgerResult<void> saveOpeningBalances(
          model::FiscalYearType fiscal_year,
          const std::vector<model::OpeningBalance> &balances) = 0;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_OPENING_BALANCE_STORE_HPP
