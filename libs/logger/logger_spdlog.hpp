/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_LOGGER_SPDLOG_HPP
#define KESSAN_LOGGER_SPDLOG_HPP

#include "logger/logger.hpp"

#include <map>
#include <memory>
#include <string>

#include <boost/optional.hpp>

namespace spdlog {
  class logger;
}

namespace logger {

  /// Patterns for logging depending on the log level.
  class LogPatterns {
   public:
    /// Set a logging pattern for the given level.
    void setPattern(LogLevel level, std::string pattern);

    /**
     * Get the logging pattern for the given level. If not set, get the
     * next present more verbose level pattern, if any, or the default
     * pattern.
     */
    std::string getPattern(LogLevel level) const;

    /// Fill the missing patterns with the values from the given parent.
    void inherit(const LogPatterns &base);

   private:
    std::map<LogLevel, std::string> patterns_;
  };

  struct LoggerConfig {
    LogLevel log_level;
    LogPatterns patterns;
  };
  using ConstLoggerConfigPtr = std::shared_ptr<const LoggerConfig>;

  class LoggerSpdlog : public Logger {
   public:
    /**
     * @param tag - the tag for logging (aka logger name)
     * @param config - logger configuration
     */
    LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config);

    bool isEnabled(Level level) const override;

   private:
    void write(Level level, const std::string &message) const override;

    /// Set pattern and level of the underlying spdlog logger.
    void setupLogger();

    const std::string tag_;
    const ConstLoggerConfigPtr config_;
    const std::shared_ptr<spdlog::logger> logger_;
  };

}  // namespace logger

#endif  // KESSAN_LOGGER_SPDLOG_HPP
