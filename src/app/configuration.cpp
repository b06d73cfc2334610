/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace weave::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        committee_file_("committee.yaml"),
        watchdog_timeout_(std::chrono::seconds{15}),
        database_{
            .directory = "db",
            .cache_size = 1 << 30,
            .in_memory = false,
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const std::filesystem::path &Configuration::committeeFile() const {
    return committee_file_;
  }

  const std::vector<std::string> &Configuration::validatorKeys() const {
    return validator_keys_;
  }

  std::chrono::milliseconds Configuration::watchdogTimeout() const {
    return watchdog_timeout_;
  }

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

  const primary::Parameters &Configuration::primary() const {
    return primary_;
  }

}  // namespace weave::app
