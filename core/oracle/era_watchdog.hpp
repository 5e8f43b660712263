/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

#include "clock/sleeper.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace eraoracle::oracle {

  /**
   * Liveness timer of era progression. Accumulates time of poll cycles
   * since the era index last increased.
   */
  class EraWatchdog {
   public:
    using Duration = std::chrono::milliseconds;

    struct Config {
      std::chrono::seconds era_duration{21600};
      /// allowed delay of era update over its duration
      std::chrono::seconds update_delay_tolerance{180};
      /// sleep before the expiration is reported
      Duration grace{std::chrono::seconds{60}};
    };

    EraWatchdog(Config config, std::shared_ptr<clock::Sleeper> sleeper);

    /**
     * Accounts one poll cycle. An era greater than the last observed one
     * resets the accumulator.
     */
    void observe(primitives::EraIndex era, Duration elapsed);

    /// Whether silence exceeds era duration plus tolerance
    bool isDelayed() const;

    Duration accumulated() const;

    /**
     * Decides on a delayed era update. Coordinator era equal to the local one
     * means the whole network is late, so the accumulator restarts. A newer
     * coordinator era or no coordinator at all confirms the delay.
     * @return WATCHDOG_EXPIRED after the grace sleep if the delay is confirmed,
     * STOPPED if stop was requested during the grace sleep
     */
    outcome::result<void> check(std::optional<primitives::EraIndex> coordinator);

   private:
    const Config config_;
    std::shared_ptr<clock::Sleeper> sleeper_;

    mutable std::mutex mutex_;
    std::optional<primitives::EraIndex> era_;
    Duration accumulated_{0};

    log::Logger log_;
  };

}  // namespace eraoracle::oracle
