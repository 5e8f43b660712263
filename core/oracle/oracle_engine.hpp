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

#include "clock/clock.hpp"
#include "clock/sleeper.hpp"
#include "log/logger.hpp"
#include "oracle/era_watchdog.hpp"
#include "oracle/oracle_error.hpp"
#include "oracle/oracle_status.hpp"
#include "oracle/report_tracker.hpp"
#include "oracle/session_provider.hpp"
#include "relay/era_boundary_locator.hpp"

namespace eraoracle::oracle {

  /**
   * State machine of the oracle: Starting, then Monitoring and Processing
   * in turn, with Recovering entered on connectivity failure of either chain.
   * The era reported on change of active era N is N - 1, the last one fully
   * elapsed.
   */
  class OracleEngine {
   public:
    struct Config {
      std::chrono::milliseconds poll_interval{180000};
    };

    OracleEngine(
        Config config,
        std::shared_ptr<SessionProvider<RelaySession>> relay_provider,
        std::shared_ptr<SessionProvider<ParachainSession>> para_provider,
        std::shared_ptr<relay::EraBoundaryLocator> locator,
        std::shared_ptr<ReportTracker> tracker,
        std::shared_ptr<EraWatchdog> watchdog,
        std::shared_ptr<clock::SteadyClock> clock,
        std::shared_ptr<clock::Sleeper> sleeper);

    /**
     * Runs until stop is requested or a fatal error occurs
     * @return success on stop, the fatal error otherwise
     */
    outcome::result<void> run();

    /**
     * Connects both chains, verifies the contract and loads report state
     */
    outcome::result<void> start();

    /**
     * One monitoring cycle: reads active era, feeds the watchdog and
     * processes the era on increase
     */
    outcome::result<void> pollOnce();

    /**
     * Reacts on an error of start or poll
     * @return the error if it is fatal or stop, success otherwise
     */
    outcome::result<void> handleError(const std::error_code &ec);

    OracleStatus status() const;

    std::optional<primitives::EraIndex> lastProcessedEra() const {
      return last_processed_;
    }

   private:
    enum class Side { Relay, Parachain };

    template <typename Result>
    Result onRelay(Result res) {
      if (res.has_error()) {
        failed_side_ = Side::Relay;
      }
      return res;
    }

    template <typename Result>
    Result onPara(Result res) {
      if (res.has_error()) {
        failed_side_ = Side::Parachain;
      }
      return res;
    }

    outcome::result<void> ensureSessions();

    /**
     * Reports every stash for the era preceding the active one
     * @return true if the era is handled, false if some report has to be
     * retried on the next poll
     */
    outcome::result<bool> processEra(primitives::EraIndex active_era);

    void recover(const std::error_code &ec);

    void closeSessions();

    void setState(EngineState state);

    void updateStatus();

    const Config config_;
    std::shared_ptr<SessionProvider<RelaySession>> relay_provider_;
    std::shared_ptr<SessionProvider<ParachainSession>> para_provider_;
    std::shared_ptr<relay::EraBoundaryLocator> locator_;
    std::shared_ptr<ReportTracker> tracker_;
    std::shared_ptr<EraWatchdog> watchdog_;
    std::shared_ptr<clock::SteadyClock> clock_;
    std::shared_ptr<clock::Sleeper> sleeper_;

    std::shared_ptr<RelaySession> relay_;
    std::shared_ptr<ParachainSession> para_;

    bool started_ = false;
    std::optional<Side> failed_side_;
    std::optional<primitives::EraIndex> last_processed_;
    std::optional<clock::SteadyClock::TimePoint> last_tick_;
    /// outlives the parachain session it was sent in
    std::optional<InFlightTx> in_flight_;

    mutable std::mutex status_mutex_;
    OracleStatus status_;

    log::Logger log_;
  };

}  // namespace eraoracle::oracle
