/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "oracle/era_watchdog.hpp"

#include <boost/assert.hpp>

#include "oracle/oracle_error.hpp"

namespace eraoracle::oracle {

  EraWatchdog::EraWatchdog(Config config,
                           std::shared_ptr<clock::Sleeper> sleeper)
      : config_{config},
        sleeper_{std::move(sleeper)},
        log_{log::createLogger("EraWatchdog", "watchdog")} {
    BOOST_ASSERT(sleeper_ != nullptr);
  }

  void EraWatchdog::observe(primitives::EraIndex era, Duration elapsed) {
    std::lock_guard lock{mutex_};
    if (not era_.has_value() or *era_ < era) {
      if (era_.has_value()) {
        SL_DEBUG(log_,
                 "Era {} -> {} after {} s",
                 *era_,
                 era,
                 std::chrono::duration_cast<std::chrono::seconds>(
                     accumulated_ + elapsed)
                     .count());
      }
      era_ = era;
      accumulated_ = Duration::zero();
      return;
    }
    accumulated_ += elapsed;
  }

  bool EraWatchdog::isDelayed() const {
    std::lock_guard lock{mutex_};
    return accumulated_ > config_.era_duration + config_.update_delay_tolerance;
  }

  EraWatchdog::Duration EraWatchdog::accumulated() const {
    std::lock_guard lock{mutex_};
    return accumulated_;
  }

  outcome::result<void> EraWatchdog::check(
      std::optional<primitives::EraIndex> coordinator) {
    std::optional<primitives::EraIndex> local;
    {
      std::lock_guard lock{mutex_};
      if (accumulated_
          <= config_.era_duration + config_.update_delay_tolerance) {
        return outcome::success();
      }
      local = era_;
      if (coordinator.has_value() and local.has_value()
          and *coordinator == *local) {
        SL_WARN(log_,
                "Era {} is delayed on the whole network, "
                "coordinator reports era {}",
                *local,
                *coordinator);
        accumulated_ = Duration::zero();
        return outcome::success();
      }
    }

    SL_CRITICAL(log_,
                "Era update is delayed: local era {}, coordinator era {}. "
                "Terminating in {} s",
                local,
                coordinator,
                std::chrono::duration_cast<std::chrono::seconds>(config_.grace)
                    .count());
    if (not sleeper_->sleepFor(config_.grace)) {
      return OracleError::STOPPED;
    }
    return OracleError::WATCHDOG_EXPIRED;
  }

}  // namespace eraoracle::oracle
