/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <utils/ctor_limiters.hpp>

#include "primary/parameters.hpp"

namespace weave::app {
  class Configuration : Singleton<Configuration> {
   public:
    struct DatabaseConfig {
      std::filesystem::path directory = "db";
      size_t cache_size = 1 << 30;  // 1GiB
      /// Keep everything in memory, nothing survives a restart
      bool in_memory = false;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;
    [[nodiscard]] virtual const std::filesystem::path &committeeFile() const;
    /// Hex seeds or paths to files with one, one per local primary
    [[nodiscard]] virtual const std::vector<std::string> &validatorKeys()
        const;
    [[nodiscard]] virtual std::chrono::milliseconds watchdogTimeout() const;

    [[nodiscard]] virtual const DatabaseConfig &database() const;

    [[nodiscard]] virtual const primary::Parameters &primary() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;
    std::filesystem::path committee_file_;
    std::vector<std::string> validator_keys_;
    std::chrono::milliseconds watchdog_timeout_;

    DatabaseConfig database_;
    primary::Parameters primary_;
  };

}  // namespace weave::app
