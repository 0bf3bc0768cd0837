/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_DB_TRANSACTION_HPP
#define KESSAN_DB_TRANSACTION_HPP

namespace kessan {
  namespace books {

    class DatabaseTransaction {
     public:
      virtual ~DatabaseTransaction() = default;

      virtual void begin() = 0;
      /// Begin a transaction in which every read sees the same snapshot
      virtual void beginSnapshot() = 0;
      virtual void commit() = 0;
      virtual void rollback() = 0;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_DB_TRANSACTION_HPP
