/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace weave::clock {

  /**
   * Time source. Actors never read std::chrono clocks directly so that tests
   * can drive header delays and retry backoff by hand.
   * @tparam ClockType std::chrono clock the time points belong to
   */
  template <typename ClockType>
  class Clock {
   public:
    using Duration = typename ClockType::duration;
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    /// Milliseconds since the clock's epoch, Unix time for SystemClock
    [[nodiscard]] virtual uint64_t nowMsec() const = 0;
  };

  /// Wall time, stamped into headers
  class SystemClock : public virtual Clock<std::chrono::system_clock> {};

  /// Monotonic time for delays, deadlines and backoff
  class SteadyClock : public virtual Clock<std::chrono::steady_clock> {};

}  // namespace weave::clock
