/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_POSTGRES_OPTIONS_HPP
#define KESSAN_POSTGRES_OPTIONS_HPP

#include <cstdint>
#include <string>

#include "logger/logger_fwd.hpp"

namespace kessan {
  namespace main {

    /**
     * Type for convenient formatting of PostgreSQL connection strings.
     */
    class PostgresOptions {
     public:
      /**
       * @param host PostgreSQL host.
       * @param port PostgreSQL port.
       * @param user PostgreSQL username.
       * @param password PostgreSQL password.
       * @param working_dbname The name of the database holding the books.
       * @param maintenance_dbname The name of database for maintenance
       * purposes. It will not be altered in any way and is used to create
       * the working database.
       * @param log Logger for internal messages.
       */
      PostgresOptions(const std::string &host,
                      uint16_t port,
                      const std::string &user,
                      const std::string &password,
                      const std::string &working_dbname,
                      const std::string &maintenance_dbname,
                      logger::LoggerPtr log);

      /// @return connection string without dbname param
      std::string connectionStringWithoutDbName() const;

      /// @return connection string to working database
      std::string workingConnectionString() const;

      /// @return connection string to maintenance database
      std::string maintenanceConnectionString() const;

      /// @return working database name
      std::string workingDbName() const;

      /// @return maintenance database name
      std::string maintenanceDbName() const;

     private:
      std::string getConnectionStringWithDbName(
          const std::string &dbname) const;

      const std::string host_;
      const uint16_t port_;
      const std::string user_;
      const std::string password_;
      const std::string working_dbname_;
      const std::string maintenance_dbname_;
    };

  }  // namespace main
}  // namespace kessan

#endif  // KESSAN_POSTGRES_OPTIONS_HPP
