/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/state_manager_impl.hpp"

#include <csignal>
#include <cstring>
#include <functional>

#include <fmt/format.h>

#include "log/logger.hpp"

namespace weave::app {
  std::weak_ptr<StateManagerImpl> StateManagerImpl::wp_to_myself;

  StateManagerImpl::SignalSet StateManagerImpl::shutdown_signals{
      {SIGINT, SIGTERM, SIGQUIT}, &StateManagerImpl::onShutdownSignal};

  StateManagerImpl::SignalSet StateManagerImpl::log_rotate_signals{
      {SIGHUP}, &StateManagerImpl::onLogRotateSignal};

  StateManagerImpl::SignalSet::SignalSet(std::initializer_list<int> signals,
                                         void (*handler)(int))
      : signals_(signals), handler_(handler) {}

  void StateManagerImpl::SignalSet::enable() {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = handler_;
    sigemptyset(&act.sa_mask);
    for (auto signal : signals_) {
      sigaddset(&act.sa_mask, signal);
    }
    // nothing is delivered halfway through installation
    sigprocmask(SIG_BLOCK, &act.sa_mask, nullptr);
    for (auto signal : signals_) {
      sigaction(signal, &act, nullptr);
    }
    enabled_ = true;
    sigprocmask(SIG_UNBLOCK, &act.sa_mask, nullptr);
  }

  void StateManagerImpl::SignalSet::disable() {
    if (not enabled_.exchange(false)) {
      return;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = SIG_DFL;
    for (auto signal : signals_) {
      sigaction(signal, &act, nullptr);
    }
  }

  void StateManagerImpl::onShutdownSignal(int signal) {
    // a second signal kills the process the default way
    shutdown_signals.disable();
    if (auto self = wp_to_myself.lock()) {
      SL_TRACE(self->logger_, "Shutdown signal {} received", signal);
      self->shutdown();
    }
  }

  void StateManagerImpl::onLogRotateSignal(int signal) {
    if (auto self = wp_to_myself.lock()) {
      SL_TRACE(self->logger_, "Log rotate signal {} received", signal);
      self->logging_system_->doLogRotate();
    }
  }

  StateManagerImpl::StateManagerImpl(
      qtils::SharedRef<log::LoggingSystem> logging_system)
      : logger_(logging_system->getLogger("StateManager", "application")),
        logging_system_(std::move(logging_system)) {
    shutdown_signals.enable();
    log_rotate_signals.enable();
    SL_TRACE(logger_, "Signal handlers set up");
  }

  StateManagerImpl::~StateManagerImpl() {
    shutdown_signals.disable();
    log_rotate_signals.disable();
    wp_to_myself.reset();
  }

  void StateManagerImpl::reset() {
    std::lock_guard lg(mutex_);
    prepare_ = {};
    launch_ = {};
    shutdown_ = {};
    state_ = State::Init;
    failed_ = false;
    std::lock_guard failure_lock(failure_mutex_);
    failure_reason_.reset();
  }

  void StateManagerImpl::atPrepare(OnPrepare &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Prepare) {
      throw AppStateException("adding callback for stage 'prepare'");
    }
    prepare_.emplace(std::move(cb));
  }

  void StateManagerImpl::atLaunch(OnLaunch &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Starting) {
      throw AppStateException("adding callback for stage 'launch'");
    }
    launch_.emplace(std::move(cb));
  }

  void StateManagerImpl::atShutdown(OnShutdown &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::ShuttingDown) {
      throw AppStateException("adding callback for stage 'shutdown'");
    }
    shutdown_.emplace(std::move(cb));
  }

  void StateManagerImpl::runStage(std::string_view name,
                                  State from,
                                  State running,
                                  State done,
                                  std::queue<std::function<bool()>> &callbacks) {
    std::lock_guard lg(mutex_);

    auto state = from;
    if (not state_.compare_exchange_strong(state, running)
        and state != State::ShuttingDown) {
      throw AppStateException(fmt::format("running stage '{}'", name));
    }

    if (not callbacks.empty()) {
      SL_TRACE(logger_, "Running stage '{}'…", name);
    }
    for (; not callbacks.empty(); callbacks.pop()) {
      if (state_ != running) {
        continue;
      }
      if (not callbacks.front()()) {
        SL_ERROR(logger_, "Stage '{}' is failed", name);
        failed_ = true;
        state = running;
        state_.compare_exchange_strong(state, State::ShuttingDown);
      }
    }

    state = running;
    state_.compare_exchange_strong(state, done);
  }

  void StateManagerImpl::doPrepare() {
    runStage("preparing",
             State::Init,
             State::Prepare,
             State::ReadyToStart,
             prepare_);
  }

  void StateManagerImpl::doLaunch() {
    runStage(
        "launch", State::ReadyToStart, State::Starting, State::Works, launch_);
  }

  void StateManagerImpl::doShutdown() {
    std::lock_guard lg(mutex_);

    auto state = State::Works;
    if (not state_.compare_exchange_strong(state, State::ShuttingDown)
        and state != State::ShuttingDown) {
      throw AppStateException("running stage 'shutting down'");
    }

    prepare_ = {};
    launch_ = {};
    for (; not shutdown_.empty(); shutdown_.pop()) {
      shutdown_.front()();
    }

    state = State::ShuttingDown;
    state_.compare_exchange_strong(state, State::ReadyToStop);
  }

  void StateManagerImpl::run() {
    wp_to_myself = weak_from_this();
    if (wp_to_myself.expired()) {
      throw std::logic_error(
          "StateManager must be instantiated on shared pointer before run");
    }

    doPrepare();
    doLaunch();

    if (state_ == State::Works) {
      SL_TRACE(logger_, "All components started; waiting shutdown request…");
      shutdownRequestWaiting();
    }

    SL_TRACE(logger_, "Start doing shutdown…");
    doShutdown();
    SL_TRACE(logger_, "Shutdown is done");

    if (state_ != State::ReadyToStop) {
      throw std::logic_error(
          "StateManager is expected in stage 'ready to stop'");
    }
  }

  void StateManagerImpl::shutdownRequestWaiting() {
    std::unique_lock lock(cv_mutex_);
    cv_.wait(lock, [&] { return state_ == State::ShuttingDown; });
  }

  void StateManagerImpl::shutdown() {
    shutdown_signals.disable();
    switch (state_.load()) {
      case State::ReadyToStop:
        SL_TRACE(logger_, "Shutting down requested, but app is ready to stop");
        return;
      case State::ShuttingDown:
        SL_TRACE(logger_, "Shutting down requested, but it's in progress");
        return;
      default:
        break;
    }

    SL_TRACE(logger_, "Shutting down requested…");
    std::lock_guard lg(cv_mutex_);
    state_ = State::ShuttingDown;
    cv_.notify_one();
  }

  void StateManagerImpl::fail(std::string reason) {
    {
      std::lock_guard lock(failure_mutex_);
      if (failure_reason_.has_value()) {
        // usually the same fault seen by another local primary
        SL_ERROR(logger_, "Another fault while shutting down: {}", reason);
        return;
      }
      SL_CRITICAL(logger_, "Unrecoverable fault: {}", reason);
      failure_reason_ = std::move(reason);
    }
    failed_ = true;
    shutdown();
  }

  std::optional<std::string> StateManagerImpl::failureReason() const {
    std::lock_guard lock(failure_mutex_);
    return failure_reason_;
  }

}  // namespace weave::app
