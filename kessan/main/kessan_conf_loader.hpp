/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_CONF_LOADER_HPP
#define KESSAN_CONF_LOADER_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <boost/optional.hpp>
#include "common/result_fwd.hpp"
#include "logger/logger_fwd.hpp"
#include "logger/logger_manager.hpp"

static const std::string kDbTypePostgres = "postgres";
static const std::string kDbTypeSqlite = "sqlite";

/// Account that receives journal legs given by an unknown account name
static const std::string kDefaultFallbackAccount = "雑費";

struct KessanConfig {
  struct DbConfig {
    std::string type;
    std::string path;
    std::string host;
    uint16_t port;
    std::string user;
    std::string password;
    std::string working_dbname;
    std::string maintenance_dbname;
  };

  DbConfig database_config;
  boost::optional<std::string> fallback_account;
  boost::optional<bool> seed_default_accounts;
  boost::optional<logger::LoggerManagerTreePtr> logger_manager;

  /// Configured fallback account, the default one if unset, none if set empty
  boost::optional<std::string> getFallbackAccount() const;

  bool getSeedDefaultAccounts() const;
};

/**
 * Parse the configuration file. Every value can be overridden by an
 * environment variable named after its path, e.g. KESSAN_DATABASE_HOST.
 * @param conf_path - path to the JSON file, empty to read the environment
 * only
 * @return the parsed configuration, or an error naming the offending path
 */
kessan::expected::Result<KessanConfig, std::string> parse_kessan_config(
    const std::string &conf_path, std::optional<logger::LoggerPtr> log);

#endif  // KESSAN_CONF_LOADER_HPP
