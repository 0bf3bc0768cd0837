/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "framework/test_db_manager.hpp"

#include <soci/soci.h>
#include <soci/sqlite3/soci-sqlite3.h>

#include "logger/logger_manager.hpp"
#include "main/impl/db_connection_init.hpp"

using namespace kessan::expected;
using namespace kessan::test;

Result<std::unique_ptr<TestDbManager>, std::string>
TestDbManager::createInMemory(bool seed_default_accounts,
                              logger::LoggerManagerTreePtr log_manager) {
  std::unique_ptr<soci::session> session;
  try {
    session = std::make_unique<soci::session>(*soci::factory_sqlite3(),
                                              "db=:memory:");
  } catch (const std::exception &e) {
    return makeError(std::string{"Failed to open in-memory database: "}
                     + e.what());
  }
  return kessan::main::DbConnectionInit::prepareSchema(
             *session, seed_default_accounts, log_manager)
      | [&]() -> Result<std::unique_ptr<TestDbManager>, std::string> {
    return makeValue(
        std::unique_ptr<TestDbManager>(new TestDbManager(std::move(session))));
  };
}

TestDbManager::~TestDbManager() = default;

soci::session &TestDbManager::getSession() {
  return *session_;
}

TestDbManager::TestDbManager(std::unique_ptr<soci::session> session)
    : session_(std::move(session)) {}
