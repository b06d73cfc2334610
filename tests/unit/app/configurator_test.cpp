/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "testutil/storage/base_fs_test.hpp"

using namespace std::chrono_literals;
using weave::app::Configuration;
using weave::app::Configurator;

class ConfiguratorTest : public test::BaseFS_Test {
 public:
  ConfiguratorTest() : test::BaseFS_Test("/tmp/weave-test-configurator") {}

  void SetUp() override {
    BaseFS_Test::SetUp();
    cwd_ = fs::current_path();
    write("committee.yaml", "epoch: 0\n");
  }

  void TearDown() override {
    // Configurator moves into the base path
    fs::current_path(cwd_);
    BaseFS_Test::TearDown();
  }

  void write(const std::string &name, const std::string &content) {
    std::ofstream file(base_path / name);
    file << content;
  }

  /// Runs both parsing steps and the final calculation over the arguments
  outcome::result<std::shared_ptr<Configuration>> configure(
      std::vector<std::string> args) {
    args.insert(args.begin(), "weave_node");
    std::vector<const char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.c_str());
    }
    const char *env[] = {nullptr};
    Configurator configurator(
        static_cast<int>(argv.size()), argv.data(), env);
    OUTCOME_TRY(configurator.step1());
    OUTCOME_TRY(configurator.step2());
    return configurator.calculateConfig(*logger);
  }

  std::string basePathArg() const {
    return "--base-path=" + base_path.string();
  }

  fs::path cwd_;
};

/**
 * @given an absolute base path holding committee.yaml
 * @when nothing else is set
 * @then relative paths resolve against the base path and the primary keeps
 * its default parameters
 */
TEST_F(ConfiguratorTest, Defaults) {
  ASSERT_OUTCOME_SUCCESS(config, configure({basePathArg()}));
  EXPECT_EQ(config->committeeFile(),
            fs::weakly_canonical(base_path / "committee.yaml"));
  EXPECT_EQ(config->database().directory,
            fs::weakly_canonical(base_path / "db"));
  EXPECT_FALSE(config->database().in_memory);
  EXPECT_EQ(config->watchdogTimeout(), 15s);
  EXPECT_EQ(config->primary().gc_depth, 50);
  EXPECT_EQ(config->primary().sync.retry_nodes, 3);
}

TEST_F(ConfiguratorTest, CommandLine) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({basePathArg(),
                                    "--name=alice",
                                    "--validator-key=0x01",
                                    "--validator-key=keys/bob.seed",
                                    "--db-in-memory",
                                    "--db-cache-size=64",
                                    "--gc-depth=7",
                                    "--max-header-delay=2s",
                                    "--watchdog-timeout=1m"}));
  EXPECT_EQ(config->nodeName(), "alice");
  EXPECT_EQ(config->validatorKeys(),
            (std::vector<std::string>{"0x01", "keys/bob.seed"}));
  EXPECT_TRUE(config->database().in_memory);
  EXPECT_EQ(config->database().cache_size, 64 << 20);
  EXPECT_EQ(config->primary().gc_depth, 7);
  EXPECT_EQ(config->primary().max_header_delay, 2s);
  EXPECT_EQ(config->watchdogTimeout(), 1min);
}

/**
 * @given a config file with general, database, primary and sync sections
 * @when the command line sets gc-depth too
 * @then file values apply and the command line wins where both are given
 */
TEST_F(ConfiguratorTest, ConfigFile) {
  write("config.yaml", R"(
general:
  name: carol
  base-path: )" + base_path.string() + R"(
  committee: committee.yaml
  validator-keys:
    - " 0xab "
database:
  path: store
  cache_size: 16M
  in-memory: true
primary:
  gc-depth: 10
  header-num-of-batches-threshold: 5
  max-header-payload-size: 1Mb
  min-header-delay: 200ms
  max-header-delay: 3s
  tick-interval: 20ms
sync:
  retry-base-delay: 100ms
  retry-nodes: 2
  max-fetch-batch: 64
)");
  ASSERT_OUTCOME_SUCCESS(
      config,
      configure({"--config=" + (base_path / "config.yaml").string(),
                 "--gc-depth=20"}));
  EXPECT_EQ(config->nodeName(), "carol");
  EXPECT_EQ(config->validatorKeys(), std::vector<std::string>{"0xab"});
  EXPECT_EQ(config->database().directory,
            fs::weakly_canonical(base_path / "store"));
  EXPECT_EQ(config->database().cache_size, 16 << 20);
  EXPECT_TRUE(config->database().in_memory);

  auto &primary = config->primary();
  EXPECT_EQ(primary.gc_depth, 20);
  EXPECT_EQ(primary.header_num_of_batches_threshold, 5);
  EXPECT_EQ(primary.max_header_payload_size, 1'000'000);
  EXPECT_EQ(primary.min_header_delay, 200ms);
  EXPECT_EQ(primary.max_header_delay, 3s);
  EXPECT_EQ(primary.tick_interval, 20ms);
  EXPECT_EQ(primary.sync.retry_base_delay, 100ms);
  EXPECT_EQ(primary.sync.retry_nodes, 2);
  EXPECT_EQ(primary.sync.max_fetch_batch, 64);
}

TEST_F(ConfiguratorTest, BadFileValues) {
  write("config.yaml", R"(
primary:
  gc-depth: many
  min-header-delay: soon
)");
  ASSERT_OUTCOME_ERROR(
      configure({basePathArg(),
                 "--config=" + (base_path / "config.yaml").string()}),
      Configurator::Error::ConfigFileParseFailed);
}

TEST_F(ConfiguratorTest, UnreadableFile) {
  write("config.yaml", "primary: [unclosed\n");
  ASSERT_OUTCOME_ERROR(
      configure({basePathArg(),
                 "--config=" + (base_path / "config.yaml").string()}),
      Configurator::Error::ConfigFileParseFailed);
}

TEST_F(ConfiguratorTest, UnknownOption) {
  ASSERT_OUTCOME_ERROR(configure({basePathArg(), "--no-such-option"}),
                       Configurator::Error::CliArgsParseFailed);
}

TEST_F(ConfiguratorTest, BadDurationOption) {
  ASSERT_OUTCOME_ERROR(configure({basePathArg(), "--max-header-delay=later"}),
                       Configurator::Error::CliArgsParseFailed);
}

/**
 * @then a relative base path, a missing committee file and inconsistent
 * primary parameters are all rejected
 */
TEST_F(ConfiguratorTest, InvalidValues) {
  ASSERT_OUTCOME_ERROR(configure({"--base-path=relative/dir"}),
                       Configurator::Error::InvalidValue);
  ASSERT_OUTCOME_ERROR(
      configure({basePathArg(), "--committee=absent.yaml"}),
      Configurator::Error::InvalidValue);
  ASSERT_OUTCOME_ERROR(configure({basePathArg(), "--gc-depth=1"}),
                       Configurator::Error::InvalidValue);

  write("config.yaml", R"(
primary:
  min-header-delay: 2s
  max-header-delay: 1s
)");
  ASSERT_OUTCOME_ERROR(
      configure({basePathArg(),
                 "--config=" + (base_path / "config.yaml").string()}),
      Configurator::Error::InvalidValue);
}

TEST_F(ConfiguratorTest, HelpStopsEarly) {
  std::vector<const char *> argv{"weave_node", "--help"};
  const char *env[] = {nullptr};
  Configurator configurator(2, argv.data(), env);
  ASSERT_OUTCOME_SUCCESS(stop, configurator.step1());
  EXPECT_TRUE(stop);
}

/**
 * @given a config file without a logging section, then one with it
 * @then the default logging config is used first, the file's one second
 */
TEST_F(ConfiguratorTest, LoggingConfig) {
  {
    std::vector<const char *> argv{"weave_node", "-lcore=debug"};
    const char *env[] = {nullptr};
    Configurator configurator(2, argv.data(), env);
    ASSERT_OUTCOME_SUCCESS_TRY(configurator.step1());
    ASSERT_OUTCOME_SUCCESS_TRY(configurator.step2());
    EXPECT_EQ(configurator.getLoggingCliArgs(),
              std::vector<std::string>{"core=debug"});
    ASSERT_OUTCOME_SUCCESS(logging, configurator.getLoggingConfig());
    EXPECT_TRUE(logging["sinks"].IsSequence());
    EXPECT_EQ(logging["groups"][0]["name"].as<std::string>(), "main");
  }

  write("config.yaml", R"(
logging:
  sinks:
    - name: file
      type: file
      path: weave.log
  groups:
    - name: everything
      sink: file
      level: debug
)");
  auto config_arg = "--config=" + (base_path / "config.yaml").string();
  std::vector<const char *> argv{"weave_node", config_arg.c_str()};
  const char *env[] = {nullptr};
  Configurator configurator(2, argv.data(), env);
  ASSERT_OUTCOME_SUCCESS_TRY(configurator.step1());
  ASSERT_OUTCOME_SUCCESS(logging, configurator.getLoggingConfig());
  EXPECT_EQ(logging["groups"][0]["name"].as<std::string>(), "everything");
}
