/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_BOOKS_FIXTURE_HPP
#define KESSAN_BOOKS_FIXTURE_HPP

#include <gtest/gtest.h>

#include <soci/soci.h>

#include "books/impl/sql_account_registry.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_db_manager.hpp"
#include "framework/test_logger.hpp"
#include "logger/logger_manager.hpp"

namespace kessan {
  namespace books {

    /**
     * Class with in-memory storage holding the default chart of accounts
     */
    class BooksTest : public ::testing::Test {
     public:
      void SetUp() override {
        auto db_manager = test::TestDbManager::createInMemory(
            true, getTestLoggerManager()->getChild("Storage"));
        ASSERT_TRUE(expected::hasValue(db_manager))
            << db_manager.assumeError();
        db_manager_ = std::move(db_manager).assumeValue();
        accounts_ = std::make_unique<SqlAccountRegistry>(
            sql(), getTestLogger("AccountRegistry"));
      }

      soci::session &sql() {
        return db_manager_->getSession();
      }

      /// Id of an active account, fails the test when there is none
      model::AccountIdType accountId(const std::string &name) {
        auto account = accounts_->findActiveByName(name);
        EXPECT_TRUE(expected::hasValue(account));
        if (auto found = expected::resultToOptionalValue(account)) {
          if (*found) {
            return (*found)->id;
          }
        }
        ADD_FAILURE() << "no active account " << name;
        return 0;
      }

      std::unique_ptr<test::TestDbManager> db_manager_;
      std::unique_ptr<SqlAccountRegistry> accounts_;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_BOOKS_FIXTURE_HPP
