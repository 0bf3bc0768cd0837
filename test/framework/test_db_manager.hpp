/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_TEST_DB_MANAGER_HPP
#define KESSAN_TEST_DB_MANAGER_HPP

#include <memory>

#include "common/result.hpp"
#include "logger/logger_manager_fwd.hpp"

namespace soci {
  class session;
}  // namespace soci

namespace kessan {
  namespace test {

    /**
     * Manages test database lifecycle.
     * Opens a private in-memory SQLite database with the bookkeeping schema
     * applied. The database disappears with the manager.
     */
    class TestDbManager {
     public:
      /**
       * @param seed_default_accounts - insert the default chart of accounts
       * @param log_manager A log manager to create loggers for child objects.
       * @return TestDbManager instance on success, or string error otherwise.
       */
      static kessan::expected::Result<std::unique_ptr<TestDbManager>,
                                      std::string>
      createInMemory(bool seed_default_accounts,
                     logger::LoggerManagerTreePtr log_manager);

      ~TestDbManager();

      /// The session bound to the database.
      soci::session &getSession();

     private:
      explicit TestDbManager(std::unique_ptr<soci::session> session);

      const std::unique_ptr<soci::session> session_;
    };
  }  // namespace test
}  // namespace kessan

#endif /* KESSAN_TEST_DB_MANAGER_HPP */
