/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_SQL_OPENING_BALANCE_STORE_HPP
#define KESSAN_SQL_OPENING_BALANCE_STORE_HPP

#include "books/opening_balance_store.hpp"

#include <soci/soci.h>
#include "books/impl/sql_db_transaction.hpp"
#include "logger/logger_fwd.hpp"

namespace kessan {
  namespace books {

    class SqlOpeningBalanceStore : public OpeningBalanceStore {
     public:
      SqlOpeningBalanceStore(soci::session &sql, logger::LoggerPtr log);

      model::LedgerResult<model::AmountType> openingBalance(
          model::FiscalYearType fiscal_year,
          model::AccountIdType account_id) override;

      model::LedgerResult<OpeningBalanceMap> openingBalances(
          model::FiscalYearType fiscal_year) override;

      model::LedgerResult<std::vector<model::OpeningBalanceView>>
      listOpeningBalances(model::FiscalYearType fiscal_year) override;

      model::LedgerResult<void> saveOpeningBalances(
          model::FiscalYearType fiscal_year,
          const std::vector<model::OpeningBalance> &balances) override;

     private:
      soci::session &sql_;
      SqlDbTransaction tx_;
      logger::LoggerPtr log_;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_SQL_OPENING_BALANCE_STORE_HPP
