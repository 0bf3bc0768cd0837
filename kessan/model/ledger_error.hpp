/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_LEDGER_ERROR_HPP
#define KESSAN_MODEL_LEDGER_ERROR_HPP

#include <string>
#include <string_view>

#include "common/result.hpp"

namespace kessan {
  namespace model {

    /**
     * Error of a registry, journal or report operation.
     * Contains the error kind, as well as a human readable message
     */
    struct LedgerError {
      enum class Kind {
        /// malformed or inconsistent input
        kValidation,
        /// account deactivation blocked by referencing entries
        kAccountInUse,
        /// unknown account, entry, asset or counterparty id
        kNotFound,
        /// account code or name collision
        kDuplicateAccount,
        /// the database layer failed
        kStorage,
      };

      LedgerError(Kind kind, std::string message);

      Kind kind;
      std::string message;

      std::string toString() const;

      bool operator==(const LedgerError &other) const;
    };

    std::string_view kindName(LedgerError::Kind kind);

    template <typename T>
    using LedgerResult = expected::Result<T, LedgerError>;

    expected::Error<LedgerError> makeLedgerError(LedgerError::Kind kind,
                                                 std::string message);

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_LEDGER_ERROR_HPP
