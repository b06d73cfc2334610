/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace weave::app {

  // An object registered with takeControl() must expose at least one of the
  // stage methods. The methods are not checked for returning bool: a method
  // with a matching name and a wrong signature must fail to compile.
  template <typename T>
  concept StatePreparable = requires(T &t) { t.prepare(); };
  template <typename T>
  concept StateStartable = requires(T &t) { t.start(); };
  template <typename T>
  concept StateStoppable = requires(T &t) { t.stop(); };

  template <typename T>
  concept StateControllable =
      StatePreparable<T> || StateStartable<T> || StateStoppable<T>;

  class StateManager {
   public:
    using OnPrepare = std::function<bool()>;
    using OnLaunch = std::function<bool()>;
    using OnShutdown = std::function<void()>;

    enum class State {
      Init,
      Prepare,
      ReadyToStart,
      Starting,
      Works,
      ShuttingDown,
      ReadyToStop,
    };

    virtual ~StateManager() = default;

    /**
     * @brief Execute \param cb at stage 'preparations' of application
     */
    virtual void atPrepare(OnPrepare &&cb) = 0;

    /**
     * @brief Execute \param cb immediately before start application
     */
    virtual void atLaunch(OnLaunch &&cb) = 0;

    /**
     * @brief Execute \param cb at stage of shutting down application
     */
    virtual void atShutdown(OnShutdown &&cb) = 0;

    /**
     * @brief Registration special methods (if any) of object as handlers
     * for stages of application life-cycle
     * @param entity is registered entity
     */
    template <StateControllable Controlled>
    void takeControl(Controlled &entity) {
      if constexpr (StatePreparable<Controlled>) {
        atPrepare([&entity]() -> bool { return entity.prepare(); });
      }
      if constexpr (StateStartable<Controlled>) {
        atLaunch([&entity]() -> bool { return entity.start(); });
      }
      if constexpr (StateStoppable<Controlled>) {
        atShutdown([&entity]() -> void { return entity.stop(); });
      }
    }

    /// Start application life cycle
    virtual void run() = 0;

    /// Initiate shutting down (at any time)
    virtual void shutdown() = 0;

    /// Initiate shutting down after an unrecoverable fault
    virtual void fail(std::string reason) = 0;

    /// True once fail() was called or a stage callback reported failure
    virtual bool failed() const = 0;

    /// Get current stage
    virtual State state() const = 0;

   protected:
    virtual void doPrepare() = 0;
    virtual void doLaunch() = 0;
    virtual void doShutdown() = 0;
  };

  struct AppStateException : public std::runtime_error {
    explicit AppStateException(std::string message)
        : std::runtime_error("Wrong workflow at " + std::move(message)) {}
  };

}  // namespace weave::app
