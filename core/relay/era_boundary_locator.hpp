/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "relay/chain_reader.hpp"

namespace eraoracle::relay {

  enum class EraLocatorError {
    /// era boundary is outside of the search window or was re-organized
    BOUNDARY_NOT_FOUND = 1,
    STOPPED,
  };

  /**
   * Finds the last block of an era. Relies on era index being non-decreasing
   * in block height.
   */
  class EraBoundaryLocator {
   public:
    virtual ~EraBoundaryLocator() = default;

    /**
     * Binary search of the last block whose active era is `era` in window
     * [max(0, head - era duration), head]
     * @return boundary block, BOUNDARY_NOT_FOUND if the era is not within
     * the window or some block in it is not available
     */
    virtual outcome::result<primitives::BlockInfo> locate(
        ChainReader &reader,
        primitives::EraIndex era,
        primitives::BlockNumber head) = 0;

    /**
     * Waits until the boundary block is finalized, then checks that it is
     * still the canonical block at its height
     * @return BOUNDARY_NOT_FOUND if the block was replaced by re-org,
     * STOPPED if stop was requested while waiting
     */
    virtual outcome::result<void> waitFinalized(
        ChainReader &reader, const primitives::BlockInfo &boundary) = 0;
  };

}  // namespace eraoracle::relay

OUTCOME_HPP_DECLARE_ERROR(eraoracle::relay, EraLocatorError);
