/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/local_primaries.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/impl/watchdog.hpp"
#include "app/state_manager.hpp"
#include "clock/clock.hpp"
#include "crypto/keystore/keystore.hpp"
#include "dag/impl/dag_store_impl.hpp"
#include "network/in_process_network.hpp"
#include "primary/primary.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "utils/fd_limit.hpp"

namespace weave::app {

  LocalPrimaries::LocalPrimaries(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<StateManager> state_manager,
      qtils::SharedRef<crypto::keystore::KeyStore> keystore,
      qtils::SharedRef<clock::SteadyClock> steady_clock,
      qtils::SharedRef<clock::SystemClock> system_clock,
      qtils::SharedRef<Watchdog> watchdog)
      : logsys_(std::move(logsys)),
        logger_(logsys_->getLogger("LocalPrimaries", "application")),
        config_(std::move(config)),
        state_manager_(std::move(state_manager)),
        keystore_(std::move(keystore)),
        steady_clock_(std::move(steady_clock)),
        system_clock_(std::move(system_clock)),
        watchdog_(std::move(watchdog)) {
    state_manager_->takeControl(*this);
  }

  LocalPrimaries::~LocalPrimaries() {
    stop();
  }

  bool LocalPrimaries::prepare() {
    try {
      committee_ = std::make_shared<const Committee>(
          loadCommittee(config_->committeeFile()));
    } catch (const std::exception &e) {
      SL_CRITICAL(logger_,
                  "Can't load committee from {}: {}",
                  config_->committeeFile().string(),
                  e.what());
      return false;
    }
    SL_INFO(logger_,
            "Committee of epoch {}: {} authorities, total stake {}",
            committee_->epoch(),
            committee_->size(),
            committee_->totalStake());

    network_ =
        std::make_shared<network::InProcessNetwork>(logsys_, committee_);

    for (auto &keypair : keystore_->keypairs()) {
      auto self = crypto::ed25519::publicKey(keypair);
      if (not committee_->contains(self)) {
        SL_CRITICAL(logger_,
                    "Validator key {:0xx} is not a committee member",
                    self);
        return false;
      }

      auto node = std::make_unique<Node>();
      node->name = committee_->nameOf(self);
      try {
        node->storage = openStorage(node->name);
      } catch (const std::exception &e) {
        SL_CRITICAL(
            logger_, "Can't open store of {}: {}", node->name, e.what());
        return false;
      }

      auto store =
          std::make_shared<dag::DagStoreImpl>(logsys_, node->storage);
      node->primary = std::make_unique<primary::Primary>(
          logsys_,
          config_->primary(),
          committee_,
          keypair,
          store,
          network_->join(self),
          steady_clock_,
          system_clock_,
          [this, name = node->name](std::string_view what,
                                    std::error_code error) {
            state_manager_->fail(
                fmt::format("primary {}: {}: {}", name, what, error.message()));
          });

      if (not node->primary->prepare()) {
        SL_CRITICAL(logger_, "Primary {} failed to recover", node->name);
        return false;
      }
      nodes_.emplace_back(std::move(node));
    }

    SL_INFO(logger_, "{} local primaries prepared", nodes_.size());
    return true;
  }

  bool LocalPrimaries::start() {
    for (auto &node : nodes_) {
      node->primary->start(watchdog_);
      node->sink = std::thread([this, &node = *node] { runSink(node); });
    }
    return true;
  }

  void LocalPrimaries::stop() {
    if (stopping_.exchange(true)) {
      return;
    }
    // network first: its delivery threads call into the primaries
    if (network_) {
      network_->stop();
    }
    for (auto &node : nodes_) {
      node->primary->stop();
    }
    for (auto &node : nodes_) {
      if (node->sink.joinable()) {
        node->sink.join();
      }
    }
    nodes_.clear();
  }

  std::shared_ptr<storage::SpacedStorage> LocalPrimaries::openStorage(
      const std::string &name) {
    auto &database = config_->database();
    if (database.in_memory) {
      return std::make_shared<storage::InMemorySpacedStorage>();
    }
    // cache and open files budgets are shared by every local store
    auto stores = std::max<size_t>(1, keystore_->keypairs().size());
    if (not open_files_budget_.has_value()) {
      auto limit = raiseFdLimit(kOpenFilesPerStore * stores, logger_);
      // half of the descriptors stay for everything but the databases
      open_files_budget_ = limit.has_value() ? limit.value() / 2 / stores : 0;
    }
    return std::make_shared<storage::RocksDb>(logsys_,
                                              database.directory / name,
                                              database.cache_size / stores,
                                              open_files_budget_.value());
  }

  void LocalPrimaries::runSink(Node &node) {
    soralog::util::setThreadName("sink");
    auto logger = logsys_->getLogger("ConsensusSink", "consensus");
    auto ping = watchdog_->add();
    auto &feed = node.primary->feed();
    auto timeout = config_->primary().tick_interval;
    while (not stopping_) {
      ping();
      auto entry = feed.nextFor(timeout);
      if (not entry.has_value()) {
        continue;
      }
      auto &certificate = *entry->certificate;
      SL_DEBUG(logger,
               "{} #{}: certificate {:0x} of {} at round {}",
               node.name,
               entry->index,
               certificate.digest(),
               committee_->nameOf(certificate.origin()),
               certificate.round());
      feed.acknowledge(entry->index);
    }
  }

}  // namespace weave::app
