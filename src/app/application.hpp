/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utils/ctor_limiters.hpp>

namespace weave::app {

  /// @class Application - weave node application interface
  class Application : private Singleton<Application> {
   public:
    virtual ~Application() = default;

    /// Runs node until shutdown, returns process exit code
    virtual int run() = 0;
  };

}  // namespace weave::app
