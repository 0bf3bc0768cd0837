/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_CONF_LITERALS_HPP
#define KESSAN_CONF_LITERALS_HPP

#include <string>
#include <unordered_map>

#include "logger/logger.hpp"

namespace config_members {
  extern const char *DbConfig;
  extern const char *DbType;
  extern const char *DbPath;
  extern const char *Host;
  extern const char *Port;
  extern const char *User;
  extern const char *Password;
  extern const char *WorkingDbName;
  extern const char *MaintenanceDbName;
  extern const char *FallbackAccount;
  extern const char *SeedDefaultAccounts;
  extern const char *LogSection;
  extern const char *LogLevel;
  extern const char *LogPatternsSection;
  extern const char *LogChildrenSection;
  extern const std::unordered_map<std::string, logger::LogLevel> LogLevels;
}  // namespace config_members

#endif  // KESSAN_CONF_LITERALS_HPP
