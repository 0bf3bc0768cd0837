/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "model/ledger_error.hpp"

#include <fmt/core.h>

namespace kessan {
  namespace model {

    LedgerError::LedgerError(Kind kind, std::string message)
        : kind(kind), message(std::move(message)) {}

    std::string LedgerError::toString() const {
      return fmt::format("{}: {}", kindName(kind), message);
    }

    bool LedgerError::operator==(const LedgerError &other) const {
      return kind == other.kind and message == other.message;
    }

    std::string_view kindName(LedgerError::Kind kind) {
      switch (kind) {
        case LedgerError::Kind::kValidation:
          return "ValidationError";
        case LedgerError::Kind::kAccountInUse:
          return "AccountInUse";
        case LedgerError::Kind::kNotFound:
          return "NotFoundError";
        case LedgerError::Kind::kDuplicateAccount:
          return "DuplicateAccount";
        case LedgerError::Kind::kStorage:
          return "StorageError";
      }
      return "UnknownError";
    }

    expected::Error<LedgerError> makeLedgerError(LedgerError::Kind kind,
                                                 std::string message) {
      return expected::makeError(LedgerError{kind, std::move(message)});
    }

  }  // namespace model
}  // namespace kessan
