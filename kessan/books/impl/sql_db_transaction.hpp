/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_SQL_DB_TRANSACTION_HPP
#define KESSAN_SQL_DB_TRANSACTION_HPP

#include "books/impl/db_transaction.hpp"

#include <soci/soci.h>
#include "books/impl/schema.hpp"

namespace kessan {
  namespace books {

    class SqlDbTransaction final : public DatabaseTransaction {
     public:
      SqlDbTransaction(SqlDbTransaction const &) = delete;
      SqlDbTransaction(SqlDbTransaction &&) = delete;

      SqlDbTransaction &operator=(SqlDbTransaction const &) = delete;
      SqlDbTransaction &operator=(SqlDbTransaction &&) = delete;

      explicit SqlDbTransaction(soci::session &sql) : sql_(sql) {}

      void begin() override {
        sql_ << "BEGIN";
      }

      void beginSnapshot() override {
        if (isPostgres(sql_)) {
          sql_ << "BEGIN ISOLATION LEVEL REPEATABLE READ";
        } else {
          // sqlite reads of a deferred transaction share one snapshot
          sql_ << "BEGIN";
        }
      }

      void commit() override {
        sql_ << "COMMIT";
      }

      void rollback() override {
        sql_ << "ROLLBACK";
      }

     private:
      soci::session &sql_;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_SQL_DB_TRANSACTION_HPP
