/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_LOGGER_LOGGER_HPP
#define KESSAN_LOGGER_LOGGER_HPP

#include "logger/logger_fwd.hpp"

#include <string>
#include <type_traits>

#include <boost/optional.hpp>
#include <fmt/core.h>
#include <fmt/format.h>

namespace logger {
  namespace detail {

    template <typename T, typename = void>
    struct HasToString : std::false_type {};

    template <typename T>
    struct HasToString<
        T,
        std::enable_if_t<std::is_same<decltype(std::declval<const T &>()
                                                   .toString()),
                                      std::string>::value>>
        : std::true_type {};

  }  // namespace detail
}  // namespace logger

namespace fmt {

  /// Ledger errors, accounts and other objects with toString() are written
  /// with it: log->error("{}", error)
  template <typename T>
  struct formatter<T,
                   std::enable_if_t<logger::detail::HasToString<T>::value,
                                    char>> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const T &val, FormatContext &ctx) const
        -> decltype(ctx.out()) {
      return formatter<std::string>::format(val.toString(), ctx);
    }
  };

  /// Unset optionals, such as a fallback account left out of the
  /// configuration, are written as "none"
  template <typename T>
  struct formatter<boost::optional<T>, char> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const boost::optional<T> &val, FormatContext &ctx) const
        -> decltype(ctx.out()) {
      return formatter<std::string>::format(
          val ? fmt::format("{}", *val) : std::string{"none"}, ctx);
    }
  };

}  // namespace fmt

namespace logger {

  enum class LogLevel {
    kTrace,
    kDebug,
    kInfo,
    kWarn,
    kError,
    kCritical,
  };

  extern const LogLevel kDefaultLogLevel;

  class Logger {
   public:
    using Level = LogLevel;

    virtual ~Logger() = default;

    /// Whether messages of the level reach the sink
    virtual bool isEnabled(Level level) const = 0;

    template <typename... Args>
    void trace(const std::string &format, const Args &... args) const {
      log(LogLevel::kTrace, format, args...);
    }

    template <typename... Args>
    void debug(const std::string &format, const Args &... args) const {
      log(LogLevel::kDebug, format, args...);
    }

    template <typename... Args>
    void info(const std::string &format, const Args &... args) const {
      log(LogLevel::kInfo, format, args...);
    }

    template <typename... Args>
    void warn(const std::string &format, const Args &... args) const {
      log(LogLevel::kWarn, format, args...);
    }

    template <typename... Args>
    void error(const std::string &format, const Args &... args) const {
      log(LogLevel::kError, format, args...);
    }

    template <typename... Args>
    void critical(const std::string &format, const Args &... args) const {
      log(LogLevel::kCritical, format, args...);
    }

    /**
     * Formats and writes the message if the level is enabled. A message
     * that fails to format is replaced by an error naming the format
     * string, so a bad log call never interrupts a ledger operation.
     */
    template <typename... Args>
    void log(Level level,
             const std::string &format,
             const Args &... args) const {
      if (not isEnabled(level)) {
        return;
      }
      std::string message;
      if (formatMessage(message, format, args...)) {
        write(level, message);
      } else {
        write(LogLevel::kError, message);
      }
    }

   protected:
    virtual void write(Level level, const std::string &message) const = 0;

   private:
    template <typename... Args>
    static bool formatMessage(std::string &message,
                              const std::string &format,
                              const Args &... args) {
      try {
        message = fmt::vformat(format, fmt::make_format_args(args...));
        return true;
      } catch (const fmt::format_error &error) {
        message = "Bad log format \"" + format + "\": " + error.what();
      }
      return false;
    }
  };

  /// "true" or "false"
  std::string boolRepr(bool value);

}  // namespace logger

#endif  // KESSAN_LOGGER_LOGGER_HPP
