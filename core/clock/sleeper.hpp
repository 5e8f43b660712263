/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace eraoracle::clock {

  /**
   * Blocking waits of the oracle loops. All of them are observed by the stop
   * request issued on a termination signal.
   */
  class Sleeper {
   public:
    using Duration = std::chrono::milliseconds;

    virtual ~Sleeper() = default;

    /**
     * Waits for the given duration or until stop is requested
     * @return false if stop was requested, true otherwise
     */
    virtual bool sleepFor(Duration duration) = 0;

    /**
     * Waits for the given duration regardless of stop request. Used while a
     * broadcast transaction is awaiting its receipt.
     */
    virtual void pause(Duration duration) = 0;

    virtual bool stopRequested() const = 0;

    virtual void requestStop() = 0;
  };

}  // namespace eraoracle::clock
