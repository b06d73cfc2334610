/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "app/application.hpp"
#include "log/logger.hpp"

namespace weave {
  class Watchdog;
}  // namespace weave

namespace weave::app {
  class Configuration;
  class LocalPrimaries;
  class StateManager;
}  // namespace weave::app

namespace weave::app {

  class ApplicationImpl final : public Application {
   public:
    ApplicationImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<Configuration> config,
                    qtils::SharedRef<StateManager> state_manager,
                    qtils::SharedRef<Watchdog> watchdog,
                    qtils::SharedRef<LocalPrimaries> primaries);

    int run() override;

   private:
    log::Logger logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<StateManager> state_manager_;
    qtils::SharedRef<Watchdog> watchdog_;
    qtils::SharedRef<LocalPrimaries> primaries_;
  };

}  // namespace weave::app
