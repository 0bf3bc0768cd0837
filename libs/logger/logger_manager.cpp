/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_manager.hpp"

namespace {
  const std::string kTagHierarchySeparator = "/";
}

namespace logger {

  LoggerManagerTree::LoggerManagerTree(ConstLoggerConfigPtr config)
      : node_tag_{}, full_tag_{}, config_(std::move(config)) {}

  LoggerManagerTree::LoggerManagerTree(LoggerConfig config)
      : LoggerManagerTree(
          std::make_shared<const LoggerConfig>(std::move(config))) {}

  LoggerManagerTree::LoggerManagerTree(std::string full_tag,
                                       std::string node_tag,
                                       ConstLoggerConfigPtr config)
      : node_tag_(std::move(node_tag)),
        full_tag_(std::move(full_tag)),
        config_(std::move(config)) {}

  LoggerManagerTreePtr LoggerManagerTree::registerChild(
      std::string tag,
      boost::optional<LogLevel> log_level,
      boost::optional<LogPatterns> patterns) {
    LoggerConfig child_config{log_level.value_or(config_->log_level),
                              patterns.value_or(LogPatterns{})};
    child_config.patterns.inherit(config_->patterns);
    auto full_tag =
        full_tag_.empty() ? tag : full_tag_ + kTagHierarchySeparator + tag;
    // std::make_shared cannot reach the private constructor
    LoggerManagerTreePtr child{new LoggerManagerTree(
        std::move(full_tag),
        tag,
        std::make_shared<const LoggerConfig>(std::move(child_config)))};
    std::lock_guard<std::mutex> lock(children_mutex_);
    children_[std::move(tag)] = child;
    return child;
  }

  LoggerPtr LoggerManagerTree::getLogger() {
    std::lock_guard<std::mutex> lock(logger_creation_mutex_);
    if (not logger_) {
      logger_ = std::make_shared<LoggerSpdlog>(
          full_tag_.empty() ? std::string{"root"} : full_tag_, config_);
    }
    return logger_;
  }

  LoggerManagerTreePtr LoggerManagerTree::getChild(const std::string &tag) {
    {
      std::lock_guard<std::mutex> lock(children_mutex_);
      auto it = children_.find(tag);
      if (it != children_.end()) {
        return it->second;
      }
    }
    return registerChild(tag, boost::none, boost::none);
  }

}  // namespace logger
