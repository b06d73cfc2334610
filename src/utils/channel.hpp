/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "utils/ctor_limiters.hpp"

namespace weave {

  /// Result of a non-blocking or time-limited send
  enum class SendStatus : uint8_t {
    Sent,
    Full,     ///< channel reached its capacity
    Timeout,  ///< capacity did not free up in time
    Closed,   ///< receiver is gone or channel closed
  };

  /**
   * @brief Bounded multi-producer single-consumer channel
   *
   * Senders are cheap to copy and share one queue. The receiver owns the
   * consuming end; destroying it closes the channel and wakes blocked
   * senders. When the last sender is gone the receiver drains the remaining
   * items and then gets std::nullopt.
   *
   * @tparam T The type of data transmitted through the channel
   */
  template <typename T>
  struct Channel {
    class Sender;
    class Receiver;

    struct State {
      explicit State(size_t capacity) : capacity(capacity) {}

      std::mutex mutex;
      std::condition_variable not_empty;
      std::condition_variable not_full;
      std::deque<T> queue;
      const size_t capacity;
      size_t senders = 0;
      bool closed = false;
    };

    class Sender {
     public:
      Sender(const Sender &other) : state_(other.state_) {
        attach();
      }
      Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}

      Sender &operator=(const Sender &other) {
        if (this != &other) {
          detach();
          state_ = other.state_;
          attach();
        }
        return *this;
      }
      Sender &operator=(Sender &&other) noexcept {
        if (this != &other) {
          detach();
          state_ = std::move(other.state_);
        }
        return *this;
      }

      ~Sender() {
        detach();
      }

      /**
       * Sends a value, waiting while the channel is full.
       * @return false if the channel got closed
       */
      bool send(T value) {
        std::unique_lock lock(state_->mutex);
        state_->not_full.wait(lock, [&] {
          return state_->closed
              or state_->queue.size() < state_->capacity;
        });
        if (state_->closed) {
          return false;
        }
        state_->queue.emplace_back(std::move(value));
        lock.unlock();
        state_->not_empty.notify_one();
        return true;
      }

      /// Sends a value, waiting for free capacity no longer than `timeout`
      template <typename Rep, typename Period>
      SendStatus sendFor(T value, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(state_->mutex);
        auto ready = state_->not_full.wait_for(lock, timeout, [&] {
          return state_->closed
              or state_->queue.size() < state_->capacity;
        });
        if (state_->closed) {
          return SendStatus::Closed;
        }
        if (not ready) {
          return SendStatus::Timeout;
        }
        state_->queue.emplace_back(std::move(value));
        lock.unlock();
        state_->not_empty.notify_one();
        return SendStatus::Sent;
      }

      /// Sends a value only if there is free capacity right now
      SendStatus trySend(T value) {
        std::unique_lock lock(state_->mutex);
        if (state_->closed) {
          return SendStatus::Closed;
        }
        if (state_->queue.size() >= state_->capacity) {
          return SendStatus::Full;
        }
        state_->queue.emplace_back(std::move(value));
        lock.unlock();
        state_->not_empty.notify_one();
        return SendStatus::Sent;
      }

      bool isClosed() const {
        std::lock_guard lock(state_->mutex);
        return state_->closed;
      }

     private:
      friend struct Channel;

      explicit Sender(std::shared_ptr<State> state) : state_(std::move(state)) {
        attach();
      }

      void attach() {
        if (state_) {
          std::lock_guard lock(state_->mutex);
          ++state_->senders;
        }
      }

      void detach() {
        if (not state_) {
          return;
        }
        bool last;
        {
          std::lock_guard lock(state_->mutex);
          last = --state_->senders == 0;
        }
        if (last) {
          state_->not_empty.notify_all();
        }
        state_.reset();
      }

      std::shared_ptr<State> state_;
    };

    class Receiver : NonCopyable {
     public:
      Receiver(Receiver &&) noexcept = default;
      Receiver &operator=(Receiver &&other) noexcept {
        if (this != &other) {
          close();
          state_ = std::move(other.state_);
        }
        return *this;
      }

      ~Receiver() {
        close();
      }

      /**
       * Waits for the next value.
       * @return std::nullopt once the channel is closed, or all senders are
       * gone and the queue is drained
       */
      std::optional<T> receive() {
        std::unique_lock lock(state_->mutex);
        state_->not_empty.wait(lock, [&] { return drained(); });
        return pop(lock);
      }

      /// Waits for the next value no longer than `timeout`
      template <typename Rep, typename Period>
      std::optional<T> receiveFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(state_->mutex);
        state_->not_empty.wait_for(lock, timeout, [&] { return drained(); });
        return pop(lock);
      }

      std::optional<T> tryReceive() {
        std::unique_lock lock(state_->mutex);
        return pop(lock);
      }

      /// Closes the channel: pending and future sends fail
      void close() {
        if (not state_) {
          return;
        }
        {
          std::lock_guard lock(state_->mutex);
          state_->closed = true;
        }
        state_->not_full.notify_all();
        state_->not_empty.notify_all();
      }

      size_t size() const {
        std::lock_guard lock(state_->mutex);
        return state_->queue.size();
      }

      /// True when nothing more can ever be received
      bool isFinished() const {
        std::lock_guard lock(state_->mutex);
        return state_->queue.empty()
           and (state_->closed or state_->senders == 0);
      }

     private:
      friend struct Channel;

      explicit Receiver(std::shared_ptr<State> state)
          : state_(std::move(state)) {}

      bool drained() const {
        return not state_->queue.empty() or state_->closed
            or state_->senders == 0;
      }

      std::optional<T> pop(std::unique_lock<std::mutex> &lock) {
        if (state_->closed or state_->queue.empty()) {
          return std::nullopt;
        }
        std::optional<T> value{std::move(state_->queue.front())};
        state_->queue.pop_front();
        lock.unlock();
        state_->not_full.notify_one();
        return value;
      }

      std::shared_ptr<State> state_;
    };

    /**
     * @brief Creates a new channel with connected receiver and sender
     * @param capacity maximum number of queued values, at least one
     */
    static std::pair<Receiver, Sender> create_channel(size_t capacity) {
      auto state = std::make_shared<State>(capacity == 0 ? 1 : capacity);
      return {Receiver{state}, Sender{state}};
    }
  };

}  // namespace weave
