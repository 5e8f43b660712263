/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "oracle/oracle_engine.hpp"

#include <algorithm>
#include <iterator>

#include <boost/assert.hpp>

namespace eraoracle::oracle {

  std::string_view toString(EngineState state) {
    switch (state) {
      case EngineState::Starting:
        return "starting";
      case EngineState::Monitoring:
        return "monitoring";
      case EngineState::Processing:
        return "processing";
      case EngineState::Recovering:
        return "recovering";
    }
    return "unknown";
  }

  OracleEngine::OracleEngine(
      Config config,
      std::shared_ptr<SessionProvider<RelaySession>> relay_provider,
      std::shared_ptr<SessionProvider<ParachainSession>> para_provider,
      std::shared_ptr<relay::EraBoundaryLocator> locator,
      std::shared_ptr<ReportTracker> tracker,
      std::shared_ptr<EraWatchdog> watchdog,
      std::shared_ptr<clock::SteadyClock> clock,
      std::shared_ptr<clock::Sleeper> sleeper)
      : config_{config},
        relay_provider_{std::move(relay_provider)},
        para_provider_{std::move(para_provider)},
        locator_{std::move(locator)},
        tracker_{std::move(tracker)},
        watchdog_{std::move(watchdog)},
        clock_{std::move(clock)},
        sleeper_{std::move(sleeper)},
        log_{log::createLogger("OracleEngine", "engine")} {
    BOOST_ASSERT(relay_provider_ != nullptr);
    BOOST_ASSERT(para_provider_ != nullptr);
    BOOST_ASSERT(locator_ != nullptr);
    BOOST_ASSERT(tracker_ != nullptr);
    BOOST_ASSERT(watchdog_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
    BOOST_ASSERT(sleeper_ != nullptr);
  }

  outcome::result<void> OracleEngine::run() {
    SL_INFO(log_, "Oracle is running, poll interval {} ms",
            config_.poll_interval.count());
    while (not sleeper_->stopRequested()) {
      if (not started_) {
        if (auto res = start(); res.has_error()) {
          if (auto handled = handleError(res.error()); handled.has_error()) {
            closeSessions();
            return handled.error();
          }
        }
        continue;
      }

      if (auto res = pollOnce(); res.has_error()) {
        // recovered cycle is resumed without the poll pause
        if (auto handled = handleError(res.error()); handled.has_error()) {
          closeSessions();
          return handled.error();
        }
        continue;
      }

      if (not sleeper_->sleepFor(config_.poll_interval)) {
        break;
      }
    }
    SL_INFO(log_, "Oracle is stopped");
    closeSessions();
    return outcome::success();
  }

  outcome::result<void> OracleEngine::start() {
    setState(EngineState::Starting);
    OUTCOME_TRY(ensureSessions());

    auto &contract = *para_->contract;
    OUTCOME_TRY(onPara(contract.verify()));
    OUTCOME_TRY(stashes, onPara(contract.getStashAccounts()));
    OUTCOME_TRY(onPara(tracker_->load(contract, stashes)));

    relay_provider_->resetFailures();
    para_provider_->resetFailures();
    started_ = true;
    SL_INFO(log_,
            "Oracle is started with {} stashes, last reported era {}",
            stashes.size(),
            tracker_->lastReportedEra());
    setState(EngineState::Monitoring);
    return outcome::success();
  }

  outcome::result<void> OracleEngine::pollOnce() {
    setState(EngineState::Monitoring);
    OUTCOME_TRY(ensureSessions());

    OUTCOME_TRY(active, onRelay(relay_->reader->activeEra(std::nullopt)));
    relay_provider_->recordSuccess();

    auto now = clock_->now();
    auto elapsed = last_tick_.has_value()
                     ? std::chrono::duration_cast<std::chrono::milliseconds>(
                           now - *last_tick_)
                     : std::chrono::milliseconds::zero();
    last_tick_ = now;
    watchdog_->observe(active.index, elapsed);

    if (watchdog_->isDelayed()) {
      std::optional<primitives::EraIndex> coordinator;
      if (para_->contract->hasCoordinator()) {
        OUTCOME_TRY(era, onPara(para_->contract->coordinatorEra()));
        para_provider_->recordSuccess();
        coordinator = era;
      }
      OUTCOME_TRY(watchdog_->check(coordinator));
    }

    {
      std::lock_guard lock{status_mutex_};
      status_.active_era = active.index;
    }

    if (last_processed_.has_value() and active.index <= *last_processed_) {
      if (active.index < *last_processed_) {
        SL_WARN(log_,
                "Active era {} is less than processed era {}, ignored",
                active.index,
                *last_processed_);
      } else {
        SL_DEBUG(log_, "Active era {} is not changed", active.index);
      }
      updateStatus();
      return outcome::success();
    }

    SL_INFO(log_, "New active era {}", active.index);
    OUTCOME_TRY(handled, processEra(active.index));
    if (handled) {
      last_processed_ = active.index;
      relay_provider_->resetFailures();
      para_provider_->resetFailures();
    } else {
      SL_WARN(log_,
              "Era {} is not fully reported, retry on the next poll",
              active.index - 1);
    }

    setState(EngineState::Monitoring);
    updateStatus();
    auto status = this->status();
    SL_INFO(log_,
            "Status: {}, active era {}, last reported era {}, boundary {}, "
            "free balance {}, transactions {} ok / {} reverted / {} likely "
            "failing, failures relay {} para {}",
            status.state,
            status.active_era,
            status.last_reported_era,
            status.last_boundary,
            status.total_free_balance,
            status.tx_success,
            status.tx_reverted,
            status.tx_likely_failing,
            status.relay_failures,
            status.para_failures);
    return outcome::success();
  }

  outcome::result<bool> OracleEngine::processEra(
      primitives::EraIndex active_era) {
    setState(EngineState::Processing);
    if (active_era == 0) {
      return true;
    }
    const primitives::EraIndex era = active_era - 1;

    auto &contract = *para_->contract;
    OUTCOME_TRY(stashes, onPara(contract.getStashAccounts()));
    para_provider_->recordSuccess();
    if (stashes.empty()) {
      SL_INFO(log_, "No stashes to report for era {}", era);
      return true;
    }

    std::vector<primitives::AccountId> pending;
    for (auto &stash : stashes) {
      OUTCOME_TRY(onPara(tracker_->ensureKnown(contract, stash)));
      if (tracker_->isAlreadyReported(stash, era)) {
        SL_DEBUG(log_, "Stash {} is already reported for era {}", stash, era);
        continue;
      }
      pending.push_back(stash);
    }
    if (in_flight_.has_value()) {
      auto it = std::find(pending.begin(), pending.end(), in_flight_->stash);
      if (in_flight_->era != era or it == pending.end()) {
        SL_INFO(log_,
                "Transaction {} of stash {} for era {} is no longer awaited",
                in_flight_->hash,
                in_flight_->stash,
                in_flight_->era);
        in_flight_.reset();
      } else {
        // settled before any other report takes a nonce
        std::rotate(pending.begin(), it, std::next(it));
      }
    }
    if (pending.empty()) {
      SL_INFO(log_, "All stashes are reported for era {}", era);
      return true;
    }

    auto &reader = *relay_->reader;
    OUTCOME_TRY(head_hash, onRelay(reader.chainHead()));
    OUTCOME_TRY(head, onRelay(reader.blockNumber(head_hash)));
    OUTCOME_TRY(boundary, onRelay(locator_->locate(reader, era, head)));
    SL_INFO(log_, "Era {} ends at block {}", era, boundary);
    OUTCOME_TRY(onRelay(locator_->waitFinalized(reader, boundary)));
    {
      std::lock_guard lock{status_mutex_};
      status_.last_boundary = boundary.number;
      status_.total_free_balance = 0;
    }

    bool handled = true;
    for (auto &stash : pending) {
      OUTCOME_TRY(snapshot,
                  onRelay(relay_->builder->build(stash, boundary.hash)));
      auto submitted = para_->submitter->submit(era, snapshot, in_flight_);
      if (submitted.has_error()) {
        // record of the contract is read again before the next attempt
        tracker_->forget(stash);
      }
      OUTCOME_TRY(tx_outcome, onPara(std::move(submitted)));
      in_flight_.reset();

      std::lock_guard lock{status_mutex_};
      switch (tx_outcome) {
        case TxOutcome::Success:
          tracker_->markReported(stash, era);
          status_.total_free_balance += snapshot.free_balance;
          ++status_.tx_success;
          SL_INFO(log_, "Stash {} is reported for era {}", stash, era);
          break;
        case TxOutcome::DebugBuilt:
          status_.total_free_balance += snapshot.free_balance;
          break;
        case TxOutcome::Reverted:
          ++status_.tx_reverted;
          handled = false;
          SL_WARN(log_,
                  "Report of stash {} for era {} is reverted",
                  stash,
                  era);
          break;
        case TxOutcome::LikelyFailing:
          ++status_.tx_likely_failing;
          handled = false;
          SL_WARN(log_,
                  "Report of stash {} for era {} is likely failing, skipped",
                  stash,
                  era);
          break;
      }
    }
    return handled;
  }

  outcome::result<void> OracleEngine::handleError(const std::error_code &ec) {
    switch (classify(ec, not started_)) {
      case ErrorClass::Stopped:
        SL_INFO(log_, "Stop requested: {}", ec.message());
        failed_side_.reset();
        return outcome::success();

      case ErrorClass::Fatal:
        SL_CRITICAL(log_, "Fatal error: {}", ec.message());
        return ec;

      case ErrorClass::BoundaryNotFound:
        SL_WARN(log_,
                "Era boundary is not locatable yet, deferred to the next "
                "poll: {}",
                ec.message());
        failed_side_.reset();
        if (not sleeper_->sleepFor(config_.poll_interval)) {
          SL_DEBUG(log_, "Deferred poll is interrupted by stop request");
        }
        return outcome::success();

      case ErrorClass::Transient:
        recover(ec);
        return outcome::success();
    }
    return ec;
  }

  void OracleEngine::recover(const std::error_code &ec) {
    setState(EngineState::Recovering);
    auto side = failed_side_.value_or(Side::Relay);
    failed_side_.reset();

    if (side == Side::Relay) {
      SL_WARN(log_,
              "Relay chain endpoint {} failed: {}",
              relay_provider_->currentUrl(),
              ec.message());
      relay_provider_->recordFailure();
      if (relay_ and relay_->connection) {
        relay_->connection->close();
      }
      relay_.reset();
    } else {
      SL_WARN(log_,
              "Parachain endpoint {} failed: {}",
              para_provider_->currentUrl(),
              ec.message());
      para_provider_->recordFailure();
      if (para_ and para_->connection) {
        para_->connection->close();
      }
      para_.reset();
    }
    updateStatus();
  }

  outcome::result<void> OracleEngine::ensureSessions() {
    if (not para_) {
      OUTCOME_TRY(session, onPara(para_provider_->connect()));
      para_ = std::move(session);
    }
    if (not relay_) {
      OUTCOME_TRY(session, onRelay(relay_provider_->connect()));
      relay_ = std::move(session);
    }
    return outcome::success();
  }

  void OracleEngine::closeSessions() {
    if (relay_ and relay_->connection) {
      relay_->connection->close();
    }
    if (para_ and para_->connection) {
      para_->connection->close();
    }
    relay_.reset();
    para_.reset();
  }

  void OracleEngine::setState(EngineState state) {
    {
      std::lock_guard lock{status_mutex_};
      if (status_.state == state) {
        return;
      }
      status_.state = state;
    }
    SL_DEBUG(log_, "State: {}", state);
  }

  void OracleEngine::updateStatus() {
    std::lock_guard lock{status_mutex_};
    status_.last_reported_era = tracker_->lastReportedEra();
    status_.relay_url = relay_provider_->currentUrl();
    status_.relay_failures = relay_provider_->failures();
    status_.para_url = para_provider_->currentUrl();
    status_.para_failures = para_provider_->failures();
    status_.watchdog_accumulated = watchdog_->accumulated();
  }

  OracleStatus OracleEngine::status() const {
    std::lock_guard lock{status_mutex_};
    return status_;
  }

}  // namespace eraoracle::oracle
