/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "books/impl/sql_counterparty_registry.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include "books/impl/sql_utils.hpp"
#include "books/impl/transaction_scope.hpp"
#include "common/result_try.hpp"
#include "logger/logger.hpp"

namespace kessan {
  namespace books {

    using model::LedgerError;
    using model::makeLedgerError;

    SqlCounterpartyRegistry::SqlCounterpartyRegistry(soci::session &sql,
                                                     logger::LoggerPtr log)
        : sql_(sql), tx_(sql), log_(std::move(log)) {}

    model::LedgerResult<std::vector<model::Counterparty>>
    SqlCounterpartyRegistry::listCounterparties() {
      return guardedQuery(
          log_,
          "listCounterparties",
          [&]() -> model::LedgerResult<std::vector<model::Counterparty>> {
            SqlBigint id = 0;
            model::Counterparty counterparty;
            soci::statement statement =
                (sql_.prepare << "SELECT id, name, code, contact_info, notes "
                                 "FROM counterparties WHERE is_active = 1 "
                                 "ORDER BY name",
                 soci::into(id),
                 soci::into(counterparty.name),
                 soci::into(counterparty.code),
                 soci::into(counterparty.contact_info),
                 soci::into(counterparty.notes));
            statement.execute();

            std::vector<model::Counterparty> counterparties;
            while (statement.fetch()) {
              counterparty.id = id;
              counterparties.push_back(counterparty);
            }
            return expected::makeValue(std::move(counterparties));
          });
    }

    model::LedgerResult<std::vector<std::string>>
    SqlCounterpartyRegistry::counterpartyNames() {
      return guardedQuery(
          log_,
          "counterpartyNames",
          [&]() -> model::LedgerResult<std::vector<std::string>> {
            std::string name;
            soci::statement statement =
                (sql_.prepare << R"(
SELECT name FROM counterparties WHERE is_active = 1
UNION
SELECT counterparty FROM journal_entries
WHERE is_deleted = 0 AND counterparty <> ''
ORDER BY 1)",
                 soci::into(name));
            statement.execute();

            std::vector<std::string> names;
            while (statement.fetch()) {
              names.push_back(name);
            }
            return expected::makeValue(std::move(names));
          });
    }

    model::LedgerResult<void> SqlCounterpartyRegistry::checkExists(
        model::CounterpartyIdType id) {
      SqlBigint counterparty_id = id;
      int found = 0;
      sql_ << "SELECT COUNT(*) FROM counterparties "
              "WHERE id = :id AND is_active = 1",
          soci::use(counterparty_id, "id"), soci::into(found);
      if (found == 0) {
        return makeLedgerError(LedgerError::Kind::kNotFound,
                               fmt::format("counterparty {} not found", id));
      }
      return expected::makeValue();
    }

    model::LedgerResult<model::CounterpartyIdType>
    SqlCounterpartyRegistry::createCounterparty(
        const model::Counterparty &counterparty) {
      auto name = boost::algorithm::trim_copy(counterparty.name);
      if (name.empty()) {
        return makeLedgerError(LedgerError::Kind::kValidation,
                               "counterparty name must not be empty");
      }
      return inTransaction(
          tx_,
          log_,
          "createCounterparty",
          [&]() -> model::LedgerResult<model::CounterpartyIdType> {
            SqlBigint id = 0;
            sql_ << "INSERT INTO counterparties "
                    "(name, code, contact_info, notes) "
                    "VALUES (:name, :code, :contact_info, :notes) RETURNING id",
                soci::use(name, "name"), soci::use(counterparty.code, "code"),
                soci::use(counterparty.contact_info, "contact_info"),
                soci::use(counterparty.notes, "notes"), soci::into(id);
            log_->debug("created counterparty {} with id {}", name, id);
            return expected::makeValue(model::CounterpartyIdType{id});
          });
    }

    model::LedgerResult<void> SqlCounterpartyRegistry::updateCounterparty(
        model::CounterpartyIdType id, const model::Counterparty &counterparty) {
      auto name = boost::algorithm::trim_copy(counterparty.name);
      if (name.empty()) {
        return makeLedgerError(LedgerError::Kind::kValidation,
                               "counterparty name must not be empty");
      }
      return inTransaction(
          tx_, log_, "updateCounterparty", [&]() -> model::LedgerResult<void> {
            KESSAN_EXPECTED_ERROR_CHECK(checkExists(id));
            SqlBigint counterparty_id = id;
            sql_ << "UPDATE counterparties SET name = :name, code = :code, "
                    "contact_info = :contact_info, notes = :notes "
                    "WHERE id = :id",
                soci::use(name, "name"), soci::use(counterparty.code, "code"),
                soci::use(counterparty.contact_info, "contact_info"),
                soci::use(counterparty.notes, "notes"),
                soci::use(counterparty_id, "id");
            log_->debug("updated counterparty {}", id);
            return expected::makeValue();
          });
    }

    model::LedgerResult<void> SqlCounterpartyRegistry::deleteCounterparty(
        model::CounterpartyIdType id) {
      return inTransaction(
          tx_, log_, "deleteCounterparty", [&]() -> model::LedgerResult<void> {
            KESSAN_EXPECTED_ERROR_CHECK(checkExists(id));
            SqlBigint counterparty_id = id;
            sql_ << "UPDATE counterparties SET is_active = 0 WHERE id = :id",
                soci::use(counterparty_id, "id");
            log_->debug("deleted counterparty {}", id);
            return expected::makeValue();
          });
    }

  }  // namespace books
}  // namespace kessan
