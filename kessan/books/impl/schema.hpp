/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_BOOKS_SCHEMA_HPP
#define KESSAN_BOOKS_SCHEMA_HPP

namespace soci {
  class session;
}

namespace kessan {
  namespace books {

    /// @return true if the session is connected through the postgresql backend
    bool isPostgres(soci::session &sql);

    /**
     * Create the bookkeeping tables and indices if they do not exist yet,
     * in the dialect of the session backend.
     */
    void prepareTables(soci::session &sql);

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_BOOKS_SCHEMA_HPP
