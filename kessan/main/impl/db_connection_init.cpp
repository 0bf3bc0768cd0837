/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/impl/db_connection_init.hpp"

#include <soci/postgresql/soci-postgresql.h>
#include <soci/sqlite3/soci-sqlite3.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/range/algorithm/replace_if.hpp>
#include <fmt/format.h>

#include "books/impl/schema.hpp"
#include "books/impl/sql_account_registry.hpp"
#include "common/result_try.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"

using namespace kessan::main;

namespace {
  /// Database connection pool size. Limits the number of similtaneous accesses.
  constexpr size_t kPostgresPoolSize = 4;

  /// In-memory SQLite databases are private to a connection, so the pool
  /// holds a single session.
  constexpr size_t kSqlitePoolSize = 1;

  std::string formatDbMessage(const char *message) {
    std::string formatted_message(message);
    boost::replace_if(formatted_message, boost::is_any_of("\r\n"), ' ');
    return formatted_message;
  }

  kessan::expected::Result<std::unique_ptr<soci::session>, std::string>
  getMaintenanceSession(const PostgresOptions &postgres_options) {
    try {
      return std::make_unique<soci::session>(
          *soci::factory_postgresql(),
          postgres_options.maintenanceConnectionString());
    } catch (std::exception &e) {
      return kessan::expected::makeError(
          fmt::format("Could not connect to maintenance database: {}",
                      formatDbMessage(e.what())));
    }
  }

  kessan::expected::Result<std::shared_ptr<soci::connection_pool>,
                           std::string>
  openPool(soci::backend_factory const &factory,
           const std::string &connection_string,
           size_t pool_size) {
    auto pool = std::make_shared<soci::connection_pool>(pool_size);
    try {
      for (size_t i = 0; i != pool_size; i++) {
        soci::session &session = pool->at(i);
        session.open(factory, connection_string);
      }
    } catch (const std::exception &e) {
      return kessan::expected::makeError(formatDbMessage(e.what()));
    }
    return kessan::expected::makeValue(pool);
  }
}  // namespace

kessan::expected::Result<void, std::string>
DbConnectionInit::prepareWorkingDatabase(const PostgresOptions &options,
                                         logger::LoggerPtr log) {
  return getMaintenanceSession(options) | [&](auto maintenance_sql)
             -> kessan::expected::Result<void, std::string> {
    try {
      int work_db_exists = 0;
      const std::string working_dbname = options.workingDbName();
      *maintenance_sql << "SELECT CASE WHEN EXISTS(SELECT datname FROM "
                          "pg_catalog.pg_database WHERE datname = :dbname) "
                          "THEN 1 ELSE 0 END",
          soci::use(working_dbname, "dbname"), soci::into(work_db_exists);
      if (not work_db_exists) {
        log->info("Creating database '{}'", working_dbname);
        *maintenance_sql << fmt::format("CREATE DATABASE {}", working_dbname);
      }
    } catch (const std::exception &e) {
      return kessan::expected::makeError(formatDbMessage(e.what()));
    }
    return kessan::expected::Value<void>{};
  };
}

kessan::expected::Result<void, std::string> DbConnectionInit::prepareSchema(
    soci::session &sql,
    bool seed_default_accounts,
    logger::LoggerManagerTreePtr log_manager) {
  try {
    books::prepareTables(sql);
  } catch (const std::exception &e) {
    return kessan::expected::makeError(fmt::format(
        "Could not prepare tables: {}", formatDbMessage(e.what())));
  }
  if (not seed_default_accounts) {
    return kessan::expected::Value<void>{};
  }
  books::SqlAccountRegistry registry(
      sql, log_manager->getChild("AccountRegistry")->getLogger());
  return registry.seedDefaultAccounts().match(
      [](const auto &) -> kessan::expected::Result<void, std::string> {
        return kessan::expected::Value<void>{};
      },
      [](const auto &e) -> kessan::expected::Result<void, std::string> {
        return kessan::expected::makeError(
            fmt::format("Could not seed accounts: {}", e.error.toString()));
      });
}

kessan::expected::Result<std::shared_ptr<soci::connection_pool>, std::string>
DbConnectionInit::init(const KessanConfig::DbConfig &db_config,
                       bool seed_default_accounts,
                       logger::LoggerManagerTreePtr log_manager) {
  auto log = log_manager->getLogger();

  kessan::expected::Result<std::shared_ptr<soci::connection_pool>,
                           std::string>
      pool = kessan::expected::makeError(
          fmt::format("unknown database type `{}'", db_config.type));
  if (db_config.type == kDbTypeSqlite) {
    log->info("Opening SQLite database '{}'", db_config.path);
    pool = openPool(*soci::factory_sqlite3(),
                    fmt::format("db={}", db_config.path),
                    kSqlitePoolSize);
  } else if (db_config.type == kDbTypePostgres) {
    PostgresOptions options(db_config.host,
                            db_config.port,
                            db_config.user,
                            db_config.password,
                            db_config.working_dbname,
                            db_config.maintenance_dbname,
                            log);
    log->info("Connecting to PostgreSQL database '{}' on {}:{}",
              options.workingDbName(),
              db_config.host,
              db_config.port);
    pool = prepareWorkingDatabase(options, log) | [&] {
      return openPool(*soci::factory_postgresql(),
                      options.workingConnectionString(),
                      kPostgresPoolSize);
    };
  }

  return std::move(pool) |
      [&](auto connection_pool)
             -> kessan::expected::Result<std::shared_ptr<soci::connection_pool>,
                                         std::string> {
    soci::session sql(*connection_pool);
    KESSAN_EXPECTED_ERROR_CHECK(
        prepareSchema(sql, seed_default_accounts, log_manager));
    return kessan::expected::makeValue(std::move(connection_pool));
  };
}
