/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "log/logger.hpp"
#include "parachain/oracle_contract.hpp"

namespace eraoracle::oracle {

  /**
   * Last reported era per stash. The table is derived from the contract, so
   * after restart it is rebuilt by `load` without any local persistence.
   */
  class ReportTracker {
   public:
    ReportTracker();

    /**
     * Queries the contract for every given stash
     */
    outcome::result<void> load(parachain::OracleContract &contract,
                               const std::vector<primitives::AccountId> &stashes);

    /**
     * Queries the contract for a stash seen for the first time
     */
    outcome::result<void> ensureKnown(parachain::OracleContract &contract,
                                      const primitives::AccountId &stash);

    bool isKnown(const primitives::AccountId &stash) const;

    bool isAlreadyReported(const primitives::AccountId &stash,
                           primitives::EraIndex era) const;

    /// Must be called only for a report confirmed by a successful receipt
    void markReported(const primitives::AccountId &stash,
                      primitives::EraIndex era);

    /// Drops the stash, so the next `ensureKnown` queries the contract again
    void forget(const primitives::AccountId &stash);

    std::optional<primitives::EraIndex> lastReported(
        const primitives::AccountId &stash) const;

    /// Max of last reported eras over all stashes
    std::optional<primitives::EraIndex> lastReportedEra() const;

   private:
    std::unordered_map<primitives::AccountId,
                       std::optional<primitives::EraIndex>>
        last_reported_;
    log::Logger log_;
  };

}  // namespace eraoracle::oracle
