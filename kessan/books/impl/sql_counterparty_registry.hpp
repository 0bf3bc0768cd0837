/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_SQL_COUNTERPARTY_REGISTRY_HPP
#define KESSAN_SQL_COUNTERPARTY_REGISTRY_HPP

#include "books/counterparty_registry.hpp"

#include <soci/soci.h>
#include "books/impl/sql_db_transaction.hpp"
#include "logger/logger_fwd.hpp"

namespace kessan {
  namespace books {

    class SqlCounterpartyRegistry : public CounterpartyRegistry {
     public:
      SqlCounterpartyRegistry(soci::session &sql, logger::LoggerPtr log);

      model::LedgerResult<std::vector<model::Counterparty>> listCounterparties()
          override;

      model::LedgerResult<std::vector<std::string>> counterpartyNames() override;

      model::LedgerResult<model::CounterpartyIdType> createCounterparty(
          const model::Counterparty &counterparty) override;

      model::LedgerResult<void> updateCounterparty(
          model::CounterpartyIdType id,
          const model::Counterparty &counterparty) override;

      model::LedgerResult<void> deleteCounterparty(
          model::CounterpartyIdType id) override;

     private:
      /// NotFoundError unless an active counterparty has the id
      model::LedgerResult<void> checkExists(model::CounterpartyIdType id);

      soci::session &sql_;
      SqlDbTransaction tx_;
      logger::LoggerPtr log_;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_SQL_COUNTERPARTY_REGISTRY_HPP
