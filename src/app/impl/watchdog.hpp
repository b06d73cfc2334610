/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

#include <soralog/util.hpp>

#include "log/logger.hpp"

#ifdef __APPLE__

#include <mach/mach.h>
#include <mach/thread_act.h>
#include <mach/thread_info.h>

namespace {
  inline uint64_t getPlatformThreadId() {
    thread_identifier_info_data_t info;
    mach_msg_type_number_t size = THREAD_IDENTIFIER_INFO_COUNT;
    auto r = thread_info(mach_thread_self(),
                         THREAD_IDENTIFIER_INFO,
                         (thread_info_t)&info,
                         &size);
    if (r != KERN_SUCCESS) {
      throw std::logic_error{"thread_info"};
    }
    return info.thread_id;
  }
}  // namespace

#else

#include <unistd.h>

#include <sys/syscall.h>

inline uint64_t getPlatformThreadId() {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
  return syscall(SYS_gettid);
}

#endif

namespace weave {

  /**
   * Watches actor threads. Each registered thread pings once per loop
   * iteration, and actor loops wake up at least once per tick. A thread
   * silent for longer than the timeout is reported to the stall handler,
   * which normally starts a graceful shutdown. A thread still silent after
   * twice the timeout since that report aborts the process.
   */
  class Watchdog {
   public:
    using Count = uint32_t;
    using Atomic = std::atomic<Count>;
    using Clock = std::chrono::steady_clock;
    using Timeout = std::chrono::milliseconds;
    /// Receives the name of the stalled thread
    using StallHandler = std::function<void(const std::string &thread_name)>;

    explicit Watchdog(qtils::SharedRef<log::LoggingSystem> logsys)
        : logger_(logsys->getLogger("Watchdog", "threads")),
          granularity_(std::chrono::seconds{1}) {}

    struct Ping {
      std::shared_ptr<Atomic> count_;

      void operator()() const {
        count_->fetch_add(1);
      }
    };

    /// Without a handler a stall aborts at once
    void setStallHandler(StallHandler handler) {
      std::unique_lock lock{mutex_};
      on_stall_ = std::move(handler);
    }

    void checkLoop(Timeout timeout) {
      while (not stopped_) {
        std::this_thread::sleep_for(granularity_);
        check(timeout);
      }
    }

    /// One pass over registered threads, `now` is injectable for tests
    void check(Timeout timeout, Clock::time_point now = Clock::now()) {
      std::unique_lock lock{mutex_};
      for (auto it = threads_.begin(); it != threads_.end();) {
        auto &thread = it->second;
        if (thread.count.use_count() == 1) {
          // the thread dropped its Ping on exit
          it = threads_.erase(it);
          continue;
        }
        auto count = thread.count->load();
        if (thread.last_count != count) {
          thread.last_count = count;
          thread.last_time = now;
          thread.reported_at.reset();
        } else if (now - thread.last_time > timeout) {
          stalled(it->first, thread, now, timeout);
        }
        ++it;
      }
    }

    /// Registers the calling thread; it is forgotten once the Ping is gone
    [[nodiscard]] Ping add() {
      std::unique_lock lock{mutex_};
      auto &thread = threads_[std::this_thread::get_id()];
      if (not thread.count) {
        thread = {.last_time = Clock::now(),
                  .last_count = 0,
                  .count = std::make_shared<Atomic>(),
                  .platform_id = getPlatformThreadId(),
                  .name = soralog::util::getThreadName()};
      }
      return Ping{thread.count};
    }

    void stop() {
      stopped_ = true;
    }

   private:
    struct Thread {
      Clock::time_point last_time;
      Count last_count = 0;
      std::shared_ptr<Atomic> count;
      uint64_t platform_id;
      std::string name;
      std::optional<Clock::time_point> reported_at;
    };

    void stalled(std::thread::id id,
                 Thread &thread,
                 Clock::time_point now,
                 Timeout timeout) {
      std::stringstream s;
      s << id;
      if (thread.reported_at.has_value() and on_stall_) {
        if (now - thread.reported_at.value() <= 2 * timeout) {
          return;
        }
        SL_CRITICAL(logger_,
                    "Thread id={}, platform_id={}, name={} still stalled "
                    "during shutdown, aborting",
                    s.str(),
                    thread.platform_id,
                    thread.name);
        std::abort();
      }
      SL_CRITICAL(logger_,
                  "ALERT Watchdog: thread id={}, platform_id={}, name={} "
                  "silent for {}ms",
                  s.str(),
                  thread.platform_id,
                  thread.name,
                  std::chrono::duration_cast<Timeout>(now - thread.last_time)
                      .count());
      if (not on_stall_) {
        std::abort();
      }
      thread.reported_at = now;
      on_stall_(thread.name);
    }

    log::Logger logger_;
    std::chrono::milliseconds granularity_;
    std::mutex mutex_;
    std::unordered_map<std::thread::id, Thread> threads_;
    StallHandler on_stall_;
    std::atomic_bool stopped_ = false;
  };
}  // namespace weave
