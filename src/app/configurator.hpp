/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <ostream>
#include <sstream>

#include <boost/program_options.hpp>
#include <log/logger.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

#include "injector/dont_inject.hpp"

namespace weave::app {
  class Configuration;
}  // namespace weave::app

namespace weave::app {

  /**
   * Builds the node configuration from the command line and an optional YAML
   * file. Command-line values win over file values, file values over
   * defaults.
   *
   * Usage: step1() (help, version, config file), step2() (everything else),
   * then calculateConfig(). Either step returns true when the process should
   * stop successfully (e.g. after printing help).
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed,
      ConfigFileParseFailed,
      InvalidValue,
    };

    DONT_INJECT(Configurator);

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv, const char **env);

    outcome::result<bool> step1();

    outcome::result<bool> step2();

    /// `logging` section of the file, or the built-in group tree
    outcome::result<YAML::Node> getLoggingConfig();

    /// Values of repeated `-l` options
    std::vector<std::string> getLoggingCliArgs() {
      return logger_cli_args_;
    }

    /// Applies file then CLI values and validates the result
    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initGeneralConfig();
    outcome::result<void> initDatabaseConfig();
    /// `primary` and `sync` sections plus their CLI overrides
    outcome::result<void> initPrimaryConfig();

    /// Starts one problem line about the config file
    std::ostream &fileError();
    outcome::result<void> reportFileErrors();

    int argc_;
    const char **argv_;
    const char **env_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace weave::app

OUTCOME_HPP_DECLARE_ERROR(weave::app, Configurator::Error);
