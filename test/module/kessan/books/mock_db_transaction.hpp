/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MOCK_DB_TRANSACTION_HPP
#define KESSAN_MOCK_DB_TRANSACTION_HPP

#include <gmock/gmock.h>

#include "books/impl/db_transaction.hpp"

namespace kessan {
  namespace books {

    class MockDatabaseTransaction : public DatabaseTransaction {
     public:
      MOCK_METHOD0(begin, void());
      MOCK_METHOD0(beginSnapshot, void());
      MOCK_METHOD0(commit, void());
      MOCK_METHOD0(rollback, void());
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_MOCK_DB_TRANSACTION_HPP
