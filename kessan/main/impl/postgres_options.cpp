/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/impl/postgres_options.hpp"

#include <boost/format.hpp>

#include "logger/logger.hpp"

using namespace kessan::main;

PostgresOptions::PostgresOptions(const std::string &host,
                                 uint16_t port,
                                 const std::string &user,
                                 const std::string &password,
                                 const std::string &working_dbname,
                                 const std::string &maintenance_dbname,
                                 logger::LoggerPtr log)
    : host_(host),
      port_(port),
      user_(user),
      password_(password),
      working_dbname_(working_dbname),
      maintenance_dbname_(maintenance_dbname) {
  if (working_dbname_ == maintenance_dbname_) {
    log->warn(
        "Working database has the same name with maintenance database: '{}'. "
        "The books will be created in the maintenance database.",
        working_dbname_);
  }
}

std::string PostgresOptions::connectionStringWithoutDbName() const {
  return (boost::format("host=%1% port=%2% user=%3% password=%4%") % host_
          % port_ % user_ % password_)
      .str();
}

std::string PostgresOptions::workingConnectionString() const {
  return getConnectionStringWithDbName(working_dbname_);
}

std::string PostgresOptions::maintenanceConnectionString() const {
  return getConnectionStringWithDbName(maintenance_dbname_);
}

std::string PostgresOptions::getConnectionStringWithDbName(
    const std::string &dbname) const {
  return connectionStringWithoutDbName() + " dbname=" + dbname;
}

std::string PostgresOptions::workingDbName() const {
  return working_dbname_;
}

std::string PostgresOptions::maintenanceDbName() const {
  return maintenance_dbname_;
}
