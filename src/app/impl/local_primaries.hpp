/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "committee/committee.hpp"
#include "log/logger.hpp"

namespace weave {
  class Watchdog;
}  // namespace weave

namespace weave::app {
  class Configuration;
  class StateManager;
}  // namespace weave::app

namespace weave::clock {
  class SteadyClock;
  class SystemClock;
}  // namespace weave::clock

namespace weave::crypto::keystore {
  class KeyStore;
}  // namespace weave::crypto::keystore

namespace weave::network {
  class InProcessNetwork;
}  // namespace weave::network

namespace weave::primary {
  class Primary;
}  // namespace weave::primary

namespace weave::storage {
  class SpacedStorage;
}  // namespace weave::storage

namespace weave::app {

  /**
   * Runs a primary for every validator key of this process. The primaries
   * talk to each other over an in-process network and each one has its
   * own store under `<database>/<authority name>`. A consensus sink thread
   * per primary logs every delivered certificate and acknowledges it.
   */
  class LocalPrimaries {
   public:
    LocalPrimaries(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<Configuration> config,
                   qtils::SharedRef<StateManager> state_manager,
                   qtils::SharedRef<crypto::keystore::KeyStore> keystore,
                   qtils::SharedRef<clock::SteadyClock> steady_clock,
                   qtils::SharedRef<clock::SystemClock> system_clock,
                   qtils::SharedRef<Watchdog> watchdog);

    ~LocalPrimaries();

    /// Loads the committee, opens stores and recovers every primary
    bool prepare();

    bool start();

    void stop();

    size_t size() const {
      return nodes_.size();
    }

   private:
    struct Node {
      std::string name;
      std::shared_ptr<storage::SpacedStorage> storage;
      std::unique_ptr<primary::Primary> primary;
      std::thread sink;
    };

    std::shared_ptr<storage::SpacedStorage> openStorage(
        const std::string &name);

    /// Descriptors asked from the system for each local RocksDB store
    static constexpr size_t kOpenFilesPerStore = 4096;

    void runSink(Node &node);

    qtils::SharedRef<log::LoggingSystem> logsys_;
    log::Logger logger_;
    qtils::SharedRef<Configuration> config_;
    qtils::SharedRef<StateManager> state_manager_;
    qtils::SharedRef<crypto::keystore::KeyStore> keystore_;
    qtils::SharedRef<clock::SteadyClock> steady_clock_;
    qtils::SharedRef<clock::SystemClock> system_clock_;
    qtils::SharedRef<Watchdog> watchdog_;

    CommitteePtr committee_;
    std::shared_ptr<network::InProcessNetwork> network_;
    std::vector<std::unique_ptr<Node>> nodes_;
    std::optional<size_t> open_files_budget_;
    std::atomic_bool stopping_ = false;
  };

}  // namespace weave::app
