/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace weave::log {
  class LoggingSystem;
}  // namespace weave::log

namespace weave::app {
  class Configuration;
  class Application;
}  // namespace weave::app

namespace weave::injector {

  /**
   * Dependency injector for a weave node. Provides all major components
   * required by the node application.
   */
  class NodeInjector final {
   public:
    explicit NodeInjector(std::shared_ptr<log::LoggingSystem> logging_system,
                          std::shared_ptr<app::Configuration> app_config);

    std::shared_ptr<app::Application> injectApplication();

   protected:
    std::shared_ptr<class NodeInjectorImpl> pimpl_;
  };

}  // namespace weave::injector
