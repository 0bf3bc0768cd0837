/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_LOGGER_LOGGER_MANAGER_HPP
#define KESSAN_LOGGER_LOGGER_MANAGER_HPP

#include "logger/logger_manager_fwd.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/optional.hpp>
#include "logger/logger_spdlog.hpp"

namespace logger {

  /**
   * A node of logger configuration tree. Each node has a tag, a config and
   * children. The full tag of a node is its parent's full tag joined with
   * the node tag by '/'. A child inherits the config of the parent unless
   * the values are overridden on registration.
   */
  class LoggerManagerTree {
   public:
    explicit LoggerManagerTree(ConstLoggerConfigPtr config);

    explicit LoggerManagerTree(LoggerConfig config);

    /**
     * Register a child configuration. The new child's configuration will
     * inherit all options from the parent except those explicitly given.
     * @param tag - the child's tag
     * @param log_level - override the log level
     * @param patterns - override the patterns
     * @return pointer to the new child
     */
    LoggerManagerTreePtr registerChild(std::string tag,
                                       boost::optional<LogLevel> log_level,
                                       boost::optional<LogPatterns> patterns);

    /// Get this node's logger.
    LoggerPtr getLogger();

    /**
     * Find the child by the tag. If not found, a child with the parent's
     * configuration is created.
     */
    LoggerManagerTreePtr getChild(const std::string &tag);

   private:
    LoggerManagerTree(std::string full_tag,
                      std::string node_tag,
                      ConstLoggerConfigPtr config);

    const std::string node_tag_;
    const std::string full_tag_;
    const ConstLoggerConfigPtr config_;

    std::mutex logger_creation_mutex_;
    LoggerPtr logger_;

    std::mutex children_mutex_;
    std::unordered_map<std::string, LoggerManagerTreePtr> children_;
  };

}  // namespace logger

#endif  // KESSAN_LOGGER_LOGGER_MANAGER_HPP
