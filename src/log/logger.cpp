/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>

#include <boost/algorithm/string/trim.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(weave::log, Error, e) {
  using E = weave::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_LOGGER:
      return "Unknown logger";
  }
  return "Unknown log::Error";
}

namespace weave::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::applyLevelChunk(std::string_view chunk) {
    auto eq = chunk.find('=');
    if (eq == std::string_view::npos) {
      OUTCOME_TRY(level, str2lvl(chunk));
      logging_system_->setLevelOfGroup(defaultGroupName, level);
      return outcome::success();
    }

    std::string group_name{chunk.substr(0, eq)};
    boost::algorithm::trim(group_name);
    if (not logging_system_->getGroup(group_name)) {
      return Error::WRONG_GROUP;
    }
    std::string level_name{chunk.substr(eq + 1)};
    boost::algorithm::trim(level_name);
    OUTCOME_TRY(level, str2lvl(level_name));
    logging_system_->setLevelOfGroup(group_name, level);
    return outcome::success();
  }

  void LoggingSystem::tuneLoggingSystem(const std::vector<std::string> &cfg) {
    for (auto &chunk : cfg) {
      if (auto res = applyLevelChunk(chunk); res.has_error()) {
        std::cerr << "Ignored log level override '" << chunk
                  << "': " << res.error().message()
                  << std::endl;  // NOLINT(performance-avoid-endl)
      }
    }
  }

}  // namespace weave::log
