/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

namespace eraoracle::clock {

  SteadyClock::TimePoint SteadyClockImpl::now() const {
    return std::chrono::steady_clock::now();
  }

}  // namespace eraoracle::clock
