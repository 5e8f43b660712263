/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace eraoracle::clock {

  /**
   * Monotonic time source. The engine measures the silence between era
   * changes with it, tests substitute a manually advanced one.
   */
  class SteadyClock {
   public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;

    virtual TimePoint now() const = 0;
  };

}  // namespace eraoracle::clock
