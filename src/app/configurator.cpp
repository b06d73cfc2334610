/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "types/constants.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(weave::app, Configurator::Error, e) {
  using E = weave::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown log::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    assert(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

}  // namespace

namespace weave::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "noname";

    config_->database_.directory = "db";
    config_->database_.cache_size = 512 << 20;  // 512MiB

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("committee", po::value<std::string>(), "Set path to committee.yaml file.")
        ("validator-key", po::value<std::vector<std::string>>(), "Hex seed or path to a seed file of a validator run by this node. Repeatable.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("watchdog-timeout", po::value<std::string>(), "Time an actor loop may stay silent before the process aborts, e.g. 15s.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lcore=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("db-path", po::value<std::string>()->default_value(config_->database_.directory), "Path to DB directory. Can be relative on base path.")
        ("db-cache-size", po::value<uint32_t>()->default_value(static_cast<uint32_t>(config_->database_.cache_size >> 20)), "Limit the memory the database cache can use <MiB>.")
        ("db-in-memory", "Keep the DAG in memory only. Nothing survives a restart.")
        ;

    po::options_description primary_options("Primary options");
    primary_options.add_options()
        ("gc-depth", po::value<uint64_t>(), "Rounds kept behind the current one before garbage collection.")
        ("max-header-delay", po::value<std::string>(), "Longest wait for batches before an own header is proposed, e.g. 1s.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(storage_options)
        .add(primary_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;
    namespace fs = std::filesystem;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Weave-node version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      std::cout << "Other commands:\n";
      std::cout << "  weave_node key generate\n";
      std::cout << "  weave_node generate-committee <dir> <count>\n";
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Weave-node version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;
    namespace fs = std::filesystem;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }
  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: weave
        children:
          - name: injector
          - name: application
          - name: threads
          - name: network
          - name: storage
            children:
              - name: dag_store
          - name: primary
            children:
              - name: core
              - name: proposer
              - name: synchronizer
              - name: consensus
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        fileError() << "Failed to load default logging config: " << e.what()
                    << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }
  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initDatabaseConfig());
    OUTCOME_TRY(initPrimaryConfig());

    return config_;
  }

  std::ostream &Configurator::fileError() {
    file_has_error_ = true;
    return file_errors_ << "E: ";
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto name = section["name"];
          if (name.IsDefined()) {
            if (name.IsScalar()) {
              auto value = name.as<std::string>();
              config_->name_ = value;
            } else {
              fileError() << "Value 'general.name' must be scalar\n";
            }
          }
          auto base_path = section["base-path"];
          if (base_path.IsDefined()) {
            if (base_path.IsScalar()) {
              auto value = base_path.as<std::string>();
              config_->base_path_ = value;
            } else {
              fileError() << "Value 'general.base-path' must be scalar\n";
            }
          }
          auto committee = section["committee"];
          if (committee.IsDefined()) {
            if (committee.IsScalar()) {
              auto value = committee.as<std::string>();
              config_->committee_file_ = value;
            } else {
              fileError() << "Value 'general.committee' must be scalar\n";
            }
          }
          auto validator_keys = section["validator-keys"];
          if (validator_keys.IsDefined()) {
            if (validator_keys.IsSequence()) {
              for (const auto &key : validator_keys) {
                if (key.IsScalar()) {
                  auto value = key.as<std::string>();
                  boost::trim(value);
                  config_->validator_keys_.emplace_back(std::move(value));
                } else {
                  fileError() << "Entries of 'general.validator-keys' "
                                 "must be scalar\n";
                }
              }
            } else {
              fileError()
                  << "Value 'general.validator-keys' must be sequence\n";
            }
          }
          auto watchdog_timeout = section["watchdog-timeout"];
          if (watchdog_timeout.IsDefined()) {
            auto value = watchdog_timeout.IsScalar()
                           ? util::parseDurationMs(
                                 watchdog_timeout.as<std::string>())
                           : std::nullopt;
            if (value.has_value()) {
              config_->watchdog_timeout_ = value.value();
            } else {
              fileError() << "Bad 'general.watchdog-timeout' value; "
                             "Expected: 500ms, 15s, 1m, etc.\n";
            }
          }
        } else {
          fileError() << "Section 'general' defined, but is not map\n";
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail;

    fail = false;
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "committee", [&](const std::string &value) {
          config_->committee_file_ = value;
        });
    find_argument<std::vector<std::string>>(
        cli_values_map_,
        "validator-key",
        [&](const std::vector<std::string> &values) {
          config_->validator_keys_ = values;
        });
    find_argument<std::string>(
        cli_values_map_, "watchdog-timeout", [&](const std::string &value) {
          if (auto timeout = util::parseDurationMs(value)) {
            config_->watchdog_timeout_ = timeout.value();
          } else {
            std::cerr << "Option --watchdog-timeout has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (not config_->base_path_.is_absolute()) {
      SL_ERROR(logger_,
               "The 'base_path' must be defined as absolute: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    current_path(config_->base_path_);

    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(path.is_absolute()
                                  ? path
                                  : (config_->base_path_ / path));
    };

    config_->committee_file_ = make_absolute(config_->committee_file_);
    if (not is_regular_file(config_->committee_file_)) {
      SL_ERROR(logger_,
               "The 'committee' file does not exist or is not a file: {}",
               config_->committee_file_.c_str());
      return Error::InvalidValue;
    }

    if (config_->watchdog_timeout_.count() <= 0) {
      SL_ERROR(logger_, "The 'watchdog-timeout' must be positive");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["database"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto path = section["path"];
          if (path.IsDefined()) {
            if (path.IsScalar()) {
              auto value = path.as<std::string>();
              config_->database_.directory = value;
            } else {
              fileError() << "Value 'database.path' must be scalar\n";
            }
          }
          auto cache_size = section["cache_size"];
          if (cache_size.IsDefined()) {
            if (cache_size.IsScalar()) {
              auto value = util::parseByteQuantity(cache_size.as<std::string>());
              if (value.has_value()) {
                config_->database_.cache_size = value.value();
              } else {
                fileError() << "Bad 'cache_size' value; "
                               "Expected: 4096, 512Mb, 1G, etc.\n";
              }
            } else {
              fileError() << "Value 'database.cache_size' must be scalar\n";
            }
          }
          auto in_memory = section["in-memory"];
          if (in_memory.IsDefined()) {
            if (in_memory.IsScalar()) {
              auto value = in_memory.as<std::string>();
              if (value == "true") {
                config_->database_.in_memory = true;
              } else if (value == "false") {
                config_->database_.in_memory = false;
              } else {
                fileError() << "Value 'database.in-memory' has wrong "
                               "value. Expected 'true' or 'false'\n";
              }
            } else {
              fileError() << "Value 'database.in-memory' must be scalar\n";
            }
          }
        } else {
          fileError() << "Section 'database' defined, but is not map\n";
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "db-path", [&](const std::string &value) {
          config_->database_.directory = value;
        });
    find_argument<uint32_t>(
        cli_values_map_, "db-cache-size", [&](const uint32_t &value) {
          config_->database_.cache_size = static_cast<size_t>(value) << 20;
        });
    if (find_argument(cli_values_map_, "db-in-memory")) {
      config_->database_.in_memory = true;
    }

    // Check values
    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(path.is_absolute()
                                  ? path
                                  : (config_->base_path_ / path));
    };

    config_->database_.directory = make_absolute(config_->database_.directory);

    return outcome::success();
  }

  outcome::result<void> Configurator::initPrimaryConfig() {
    auto &primary = config_->primary_;

    auto read_count = [&](const YAML::Node &section,
                          std::string_view section_name,
                          const char *key,
                          auto &target) {
      auto node = section[key];
      if (not node.IsDefined()) {
        return;
      }
      using Target = std::remove_reference_t<decltype(target)>;
      try {
        if (not node.IsScalar()) {
          throw std::invalid_argument("not a scalar");
        }
        target = node.as<Target>();
      } catch (const std::exception &) {
        fileError() << "Value '" << section_name << "." << key
                    << "' must be a non-negative number\n";
      }
    };
    auto read_bytes = [&](const YAML::Node &section,
                          std::string_view section_name,
                          const char *key,
                          uint64_t &target) {
      auto node = section[key];
      if (not node.IsDefined()) {
        return;
      }
      auto value = node.IsScalar()
                     ? util::parseByteQuantity(node.as<std::string>())
                     : std::nullopt;
      if (value.has_value()) {
        target = value.value();
      } else {
        fileError() << "Bad '" << section_name << "." << key
                    << "' value; Expected: 4096, 512Kb, 1M, etc.\n";
      }
    };
    auto read_duration = [&](const YAML::Node &section,
                             std::string_view section_name,
                             const char *key,
                             std::chrono::milliseconds &target) {
      auto node = section[key];
      if (not node.IsDefined()) {
        return;
      }
      auto value = node.IsScalar() ? util::parseDurationMs(node.as<std::string>())
                                   : std::nullopt;
      if (value.has_value()) {
        target = value.value();
      } else {
        fileError() << "Bad '" << section_name << "." << key
                    << "' value; Expected: 500ms, 2s, 1m, etc.\n";
      }
    };

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["primary"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          constexpr std::string_view name = "primary";
          read_count(section, name, "gc-depth", primary.gc_depth);
          read_count(section,
                     name,
                     "max-round-lookahead",
                     primary.max_round_lookahead);
          read_count(section,
                     name,
                     "header-num-of-batches-threshold",
                     primary.header_num_of_batches_threshold);
          read_count(section,
                     name,
                     "max-header-num-of-batches",
                     primary.max_header_num_of_batches);
          read_bytes(section,
                     name,
                     "max-header-payload-size",
                     primary.max_header_payload_size);
          read_duration(
              section, name, "min-header-delay", primary.min_header_delay);
          read_duration(
              section, name, "max-header-delay", primary.max_header_delay);
          read_duration(
              section, name, "pending-timeout", primary.pending_timeout);
          read_count(section,
                     name,
                     "max-pending-vertices",
                     primary.max_pending_vertices);
          read_count(section,
                     name,
                     "digest-board-capacity",
                     primary.digest_board_capacity);
          read_count(
              section, name, "channel-capacity", primary.channel_capacity);
          read_count(section,
                     name,
                     "consensus-feed-capacity",
                     primary.consensus_feed_capacity);
          read_duration(section, name, "tick-interval", primary.tick_interval);
          read_duration(section,
                        name,
                        "stall-alert-threshold",
                        primary.stall_alert_threshold);
        } else {
          fileError() << "Section 'primary' defined, but is not map\n";
        }
      }

      auto sync_section = (*config_file_)["sync"];
      if (sync_section.IsDefined()) {
        if (sync_section.IsMap()) {
          constexpr std::string_view name = "sync";
          auto &sync = primary.sync;
          read_duration(
              sync_section, name, "retry-base-delay", sync.retry_base_delay);
          read_duration(
              sync_section, name, "retry-max-delay", sync.retry_max_delay);
          read_count(sync_section, name, "max-attempts", sync.max_attempts);
          read_duration(sync_section, name, "deadline", sync.deadline);
          read_duration(
              sync_section, name, "request-timeout", sync.request_timeout);
          read_count(sync_section, name, "retry-nodes", sync.retry_nodes);
          read_count(
              sync_section, name, "max-fetch-batch", sync.max_fetch_batch);
        } else {
          fileError() << "Section 'sync' defined, but is not map\n";
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail;

    fail = false;
    find_argument<uint64_t>(
        cli_values_map_, "gc-depth", [&](const uint64_t &value) {
          primary.gc_depth = value;
        });
    find_argument<std::string>(
        cli_values_map_, "max-header-delay", [&](const std::string &value) {
          if (auto delay = util::parseDurationMs(value)) {
            primary.max_header_delay = delay.value();
          } else {
            std::cerr << "Option --max-header-delay has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (primary.gc_depth < 2) {
      SL_ERROR(logger_, "The 'gc-depth' must be at least 2");
      return Error::InvalidValue;
    }
    if (primary.min_header_delay > primary.max_header_delay) {
      SL_ERROR(logger_,
               "The 'min-header-delay' must not exceed 'max-header-delay'");
      return Error::InvalidValue;
    }
    if (primary.max_header_num_of_batches > kMaxHeaderBatches) {
      SL_ERROR(logger_,
               "The 'max-header-num-of-batches' must not exceed {}",
               kMaxHeaderBatches);
      return Error::InvalidValue;
    }
    if (primary.tick_interval.count() <= 0) {
      SL_ERROR(logger_, "The 'tick-interval' must be positive");
      return Error::InvalidValue;
    }
    if (primary.channel_capacity == 0 or primary.consensus_feed_capacity == 0
        or primary.sync.max_fetch_batch == 0
        or primary.sync.max_fetch_batch > kMaxFetchDigests
        or primary.sync.max_attempts == 0) {
      SL_ERROR(logger_,
               "Capacities, 'max-attempts' and 'max-fetch-batch' must be "
               "positive; 'max-fetch-batch' must not exceed {}",
               kMaxFetchDigests);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

}  // namespace weave::app
