/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_SQL_ACCOUNT_REGISTRY_HPP
#define KESSAN_SQL_ACCOUNT_REGISTRY_HPP

#include "books/account_registry.hpp"

#include <soci/soci.h>
#include "books/impl/sql_db_transaction.hpp"
#include "logger/logger_fwd.hpp"

namespace kessan {
  namespace books {

    class SqlAccountRegistry : public AccountRegistry {
     public:
      SqlAccountRegistry(soci::session &sql, logger::LoggerPtr log);

      model::LedgerResult<std::vector<model::Account>> listAccounts(
          bool active_only) override;

      model::LedgerResult<model::AccountIdType> createAccount(
          const std::string &code,
          const std::string &name,
          model::AccountCategory category,
          model::TaxClassification tax_default) override;

      model::LedgerResult<void> deactivateAccount(
          model::AccountIdType id) override;

      model::LedgerResult<boost::optional<model::Account>> findById(
          model::AccountIdType id) override;

      model::LedgerResult<boost::optional<model::Account>> findActiveByName(
          const std::string &name) override;

      model::LedgerResult<size_t> seedDefaultAccounts() override;

     private:
      model::AccountIdType insertAccount(const std::string &code,
                                         const std::string &name,
                                         model::AccountCategory category,
                                         model::TaxClassification tax_default);

      soci::session &sql_;
      SqlDbTransaction tx_;
      logger::LoggerPtr log_;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_SQL_ACCOUNT_REGISTRY_HPP
