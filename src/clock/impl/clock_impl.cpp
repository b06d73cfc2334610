/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

namespace weave::clock {

  template <typename ClockType>
  uint64_t ClockImpl<ClockType>::nowMsec() const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    return duration_cast<milliseconds>(ClockType::now().time_since_epoch())
        .count();
  }

  template class ClockImpl<std::chrono::system_clock>;
  template class ClockImpl<std::chrono::steady_clock>;

}  // namespace weave::clock
