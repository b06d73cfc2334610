/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <soralog/util.hpp>

#include "app/impl/watchdog.hpp"
#include "utils/ctor_limiters.hpp"

namespace weave::utils {

  /**
   * Thread repeating one step of an actor loop until stopped. The step must
   * return within a tick; the thread pings the watchdog after each step.
   */
  class LoopThread : NonCopyable, NonMovable {
   public:
    using Step = std::function<void()>;

    ~LoopThread() {
      stop();
    }

    void start(std::string name,
               std::shared_ptr<Watchdog> watchdog,
               Step step) {
      stopped_ = false;
      worker_ = std::thread([this,
                             name{std::move(name)},
                             watchdog{std::move(watchdog)},
                             step{std::move(step)}] {
        soralog::util::setThreadName(name);
        std::optional<Watchdog::Ping> ping;
        if (watchdog) {
          ping = watchdog->add();
        }
        while (not stopped_) {
          step();
          if (ping) {
            (*ping)();
          }
        }
      });
    }

    /// Requests the loop to finish after the current step and joins it.
    /// Must not be called from the loop thread itself.
    void stop() {
      stopped_ = true;
      if (worker_.joinable()) {
        worker_.join();
      }
    }

    /// Lets the loop finish after the current step, without joining
    void requestStop() {
      stopped_ = true;
    }

    [[nodiscard]] bool running() const {
      return worker_.joinable() and not stopped_;
    }

   private:
    std::thread worker_;
    std::atomic_bool stopped_ = true;
  };

}  // namespace weave::utils
