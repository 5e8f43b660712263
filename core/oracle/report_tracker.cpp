/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "oracle/report_tracker.hpp"

namespace eraoracle::oracle {

  ReportTracker::ReportTracker()
      : log_{log::createLogger("ReportTracker", "report_tracker")} {}

  outcome::result<void> ReportTracker::load(
      parachain::OracleContract &contract,
      const std::vector<primitives::AccountId> &stashes) {
    last_reported_.clear();
    for (auto &stash : stashes) {
      OUTCOME_TRY(ensureKnown(contract, stash));
    }
    SL_INFO(log_, "Loaded report state of {} stashes", last_reported_.size());
    return outcome::success();
  }

  outcome::result<void> ReportTracker::ensureKnown(
      parachain::OracleContract &contract, const primitives::AccountId &stash) {
    if (isKnown(stash)) {
      return outcome::success();
    }
    OUTCOME_TRY(record, contract.isReportedLastEra(stash));

    // unflagged era is the one to re-attempt
    std::optional<primitives::EraIndex> last;
    if (record.reported) {
      last = record.era;
    } else if (record.era > 0) {
      last = record.era - 1;
    }
    SL_DEBUG(log_, "Stash {} was last reported for era {}", stash, last);
    last_reported_.emplace(stash, last);
    return outcome::success();
  }

  bool ReportTracker::isKnown(const primitives::AccountId &stash) const {
    return last_reported_.contains(stash);
  }

  bool ReportTracker::isAlreadyReported(const primitives::AccountId &stash,
                                        primitives::EraIndex era) const {
    auto last = lastReported(stash);
    return last.has_value() and *last >= era;
  }

  void ReportTracker::markReported(const primitives::AccountId &stash,
                                   primitives::EraIndex era) {
    auto &last = last_reported_[stash];
    if (not last.has_value() or *last < era) {
      last = era;
    }
    SL_DEBUG(log_, "Stash {} is reported for era {}", stash, era);
  }

  void ReportTracker::forget(const primitives::AccountId &stash) {
    if (last_reported_.erase(stash) != 0) {
      SL_DEBUG(log_, "Stash {} is forgotten", stash);
    }
  }

  std::optional<primitives::EraIndex> ReportTracker::lastReported(
      const primitives::AccountId &stash) const {
    if (auto it = last_reported_.find(stash); it != last_reported_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  std::optional<primitives::EraIndex> ReportTracker::lastReportedEra() const {
    std::optional<primitives::EraIndex> result;
    for (auto &[stash, last] : last_reported_) {
      if (last.has_value() and (not result or *result < *last)) {
        result = last;
      }
    }
    return result;
  }

}  // namespace eraoracle::oracle
