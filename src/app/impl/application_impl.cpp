/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/application_impl.hpp"

#include <thread>
#include <unistd.h>

#include <fmt/format.h>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/impl/local_primaries.hpp"
#include "app/impl/watchdog.hpp"
#include "app/state_manager.hpp"

namespace weave::app {

  ApplicationImpl::ApplicationImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<StateManager> state_manager,
      qtils::SharedRef<Watchdog> watchdog,
      qtils::SharedRef<LocalPrimaries> primaries)
      : logger_(logsys->getLogger("Application", "application")),
        app_config_(std::move(config)),
        state_manager_(std::move(state_manager)),
        watchdog_(std::move(watchdog)),
        primaries_(std::move(primaries)) {}

  int ApplicationImpl::run() {
    logger_->info("Start as node version '{}' named as '{}' with PID {}",
                  app_config_->nodeVersion(),
                  app_config_->nodeName(),
                  getpid());

    watchdog_->setStallHandler([this](const std::string &thread_name) {
      state_manager_->fail(
          fmt::format("thread '{}' stopped making progress", thread_name));
    });
    // keeps watching during shutdown, a stuck stop aborts the process
    std::thread watchdog_thread([this] {
      soralog::util::setThreadName("watchdog");
      watchdog_->checkLoop(app_config_->watchdogTimeout());
    });

    state_manager_->run();

    watchdog_->stop();

    watchdog_thread.join();

    if (state_manager_->failed()) {
      SL_ERROR(logger_, "Node stopped after a failure");
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  }

}  // namespace weave::app
