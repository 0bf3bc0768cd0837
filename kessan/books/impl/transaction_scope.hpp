/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_TRANSACTION_SCOPE_HPP
#define KESSAN_TRANSACTION_SCOPE_HPP

#include <exception>
#include <string_view>

#include <fmt/format.h>
#include "books/impl/db_transaction.hpp"
#include "logger/logger.hpp"
#include "model/ledger_error.hpp"

namespace kessan {
  namespace books {

    enum class TransactionMode {
      kReadWrite,
      kSnapshot,
    };

    /**
     * Run a database access, converting any exception thrown by the database
     * layer into a StorageError.
     * @param f - function returning LedgerResult
     */
    template <typename Func>
    auto guardedQuery(const logger::LoggerPtr &log,
                      std::string_view operation,
                      Func &&f) -> decltype(f()) {
      try {
        return f();
      } catch (const std::exception &e) {
        log->error("{} failed: {}", operation, e.what());
        return model::makeLedgerError(model::LedgerError::Kind::kStorage,
                                      fmt::format("{}: {}", operation, e.what()));
      }
    }

    /**
     * Run f inside a transaction. The transaction is committed if f returns a
     * value, and rolled back if f returns an error or throws.
     * @param f - function returning LedgerResult
     */
    template <typename Func>
    auto inTransaction(DatabaseTransaction &tx,
                       const logger::LoggerPtr &log,
                       std::string_view operation,
                       Func &&f,
                       TransactionMode mode = TransactionMode::kReadWrite)
        -> decltype(f()) {
      using ReturnType = decltype(f());
      try {
        if (mode == TransactionMode::kSnapshot) {
          tx.beginSnapshot();
        } else {
          tx.begin();
        }
      } catch (const std::exception &e) {
        log->error("{}: could not begin transaction: {}", operation, e.what());
        return model::makeLedgerError(model::LedgerError::Kind::kStorage,
                                      fmt::format("{}: {}", operation, e.what()));
      }

      try {
        ReturnType result = f();
        if (expected::hasValue(result)) {
          tx.commit();
        } else {
          tx.rollback();
        }
        return result;
      } catch (const std::exception &e) {
        log->error("{} failed: {}", operation, e.what());
        try {
          tx.rollback();
        } catch (const std::exception &rollback_error) {
          log->error("{}: rollback failed: {}", operation, rollback_error.what());
        }
        return model::makeLedgerError(model::LedgerError::Kind::kStorage,
                                      fmt::format("{}: {}", operation, e.what()));
      }
    }

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_TRANSACTION_SCOPE_HPP
