/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_DB_CONNECTION_INIT_HPP
#define KESSAN_DB_CONNECTION_INIT_HPP

#include <memory>
#include <string>

#include <soci/soci.h>
#include "common/result.hpp"
#include "logger/logger_fwd.hpp"
#include "logger/logger_manager_fwd.hpp"
#include "main/impl/postgres_options.hpp"
#include "main/kessan_conf_loader.hpp"

namespace kessan {
  namespace main {

    class DbConnectionInit {
     public:
      /**
       * Open a pool of sessions to the configured database, creating the
       * database and its tables when they do not exist yet.
       * @param db_config - the database section of the configuration
       * @param seed_default_accounts - insert the default chart of accounts
       * into an empty accounts table
       * @param log_manager - log manager of the storage
       * @return the connection pool or an error message
       */
      static expected::Result<std::shared_ptr<soci::connection_pool>,
                              std::string>
      init(const KessanConfig::DbConfig &db_config,
           bool seed_default_accounts,
           logger::LoggerManagerTreePtr log_manager);

      /**
       * Create the working PostgreSQL database through the maintenance one
       * unless it already exists.
       */
      static expected::Result<void, std::string> prepareWorkingDatabase(
          const PostgresOptions &options, logger::LoggerPtr log);

      /// Apply the schema and, when asked, the default chart of accounts.
      static expected::Result<void, std::string> prepareSchema(
          soci::session &sql,
          bool seed_default_accounts,
          logger::LoggerManagerTreePtr log_manager);
    };

  }  // namespace main
}  // namespace kessan

#endif  // KESSAN_DB_CONNECTION_INIT_HPP
