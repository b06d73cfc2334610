/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "app/state_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "utils/ctor_limiters.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog
namespace weave::log {
  class LoggingSystem;
}  // namespace weave::log

namespace weave::app {

  /**
   * Runs registered callbacks stage by stage and parks the main thread until
   * shutdown is requested by a signal, by shutdown() or by a component
   * reporting a fault through fail().
   */
  class StateManagerImpl  // left non-final on purpose to be accessible in tests
      : Singleton<StateManager>,
        public StateManager,
        public std::enable_shared_from_this<StateManagerImpl> {
   public:
    StateManagerImpl(qtils::SharedRef<log::LoggingSystem> logging_system);

    ~StateManagerImpl() override;

    void atPrepare(OnPrepare &&cb) override;
    void atLaunch(OnLaunch &&cb) override;
    void atShutdown(OnShutdown &&cb) override;

    void run() override;
    void shutdown() override;

    /// Only the first reported reason is kept
    void fail(std::string reason) override;

    bool failed() const override {
      return failed_;
    }

    std::optional<std::string> failureReason() const;

    State state() const override {
      return state_;
    }

   protected:
    void reset();

    void doPrepare() override;
    void doLaunch() override;
    void doShutdown() override;

   private:
    /// Signals sharing one handler, installed and restored together
    class SignalSet {
     public:
      SignalSet(std::initializer_list<int> signals, void (*handler)(int));

      void enable();
      /// Restores default handling, safe to call from the handler
      void disable();

     private:
      std::vector<int> signals_;
      void (*handler_)(int);
      std::atomic_bool enabled_ = false;
    };

    static void onShutdownSignal(int signal);
    static void onLogRotateSignal(int signal);

    static std::weak_ptr<StateManagerImpl> wp_to_myself;
    static SignalSet shutdown_signals;
    static SignalSet log_rotate_signals;

    /**
     * Moves from `from` to `running`, runs the queued callbacks while the
     * state stays `running`, then moves to `done`. A failing callback turns
     * the state into ShuttingDown, the rest of the queue is dropped.
     */
    void runStage(std::string_view name,
                  State from,
                  State running,
                  State done,
                  std::queue<std::function<bool()>> &callbacks);

    void shutdownRequestWaiting();

    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<log::LoggingSystem> logging_system_;

    std::atomic<State> state_ = State::Init;
    std::atomic_bool failed_ = false;
    mutable std::mutex failure_mutex_;
    std::optional<std::string> failure_reason_;

    std::recursive_mutex mutex_;

    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::queue<OnPrepare> prepare_;
    std::queue<OnLaunch> launch_;
    std::queue<OnShutdown> shutdown_;
  };

}  // namespace weave::app
