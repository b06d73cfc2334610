/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace weave::clock {

  template <typename ClockType>
  class ClockImpl : virtual public Clock<ClockType> {
   public:
    typename Clock<ClockType>::TimePoint now() const override {
      return ClockType::now();
    }

    uint64_t nowMsec() const override;
  };

  class SystemClockImpl final : public SystemClock,
                                public ClockImpl<std::chrono::system_clock> {};

  class SteadyClockImpl final : public SteadyClock,
                                public ClockImpl<std::chrono::steady_clock> {};

}  // namespace weave::clock
