/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/staking.hpp"

namespace eraoracle::oracle {

  /**
   * Reads staking position of a stash. All reads of one snapshot are made at
   * the same block.
   */
  class ReportBuilder {
   public:
    virtual ~ReportBuilder() = default;

    /**
     * @return snapshot of the stash at the block; a stash without controller
     * yields status None with zero balances
     */
    virtual outcome::result<primitives::StakingSnapshot> build(
        const primitives::AccountId &stash,
        const primitives::BlockHash &block_hash) = 0;
  };

}  // namespace eraoracle::oracle
