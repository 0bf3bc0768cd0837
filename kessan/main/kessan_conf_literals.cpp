/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/kessan_conf_literals.hpp"

namespace config_members {
  const char *DbConfig = "database";
  const char *DbType = "type";
  const char *DbPath = "path";
  const char *Host = "host";
  const char *Port = "port";
  const char *User = "user";
  const char *Password = "password";
  const char *WorkingDbName = "working database";
  const char *MaintenanceDbName = "maintenance database";
  const char *FallbackAccount = "fallback account";
  const char *SeedDefaultAccounts = "seed default accounts";
  const char *LogSection = "log";
  const char *LogLevel = "level";
  const char *LogPatternsSection = "patterns";
  const char *LogChildrenSection = "children";
  const std::unordered_map<std::string, logger::LogLevel> LogLevels{
      {"trace", logger::LogLevel::kTrace},
      {"debug", logger::LogLevel::kDebug},
      {"info", logger::LogLevel::kInfo},
      {"warning", logger::LogLevel::kWarn},
      {"error", logger::LogLevel::kError},
      {"critical", logger::LogLevel::kCritical}};
}  // namespace config_members
