/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_set>

#include "outcome/outcome.hpp"
#include "primitives/staking.hpp"

namespace eraoracle::relay {

  enum class ChainReaderError {
    /// block or required storage value is absent
    NOT_FOUND = 1,
    /// storage value can not be decoded
    DECODE_ERROR,
    /// node response has unexpected shape
    MALFORMED_RESPONSE,
  };

  using AccountSet = std::unordered_set<primitives::AccountId>;

  /**
   * Typed point-in-time queries to the relay chain. Every query except the
   * head ones takes an explicit block hash.
   */
  class ChainReader {
   public:
    virtual ~ChainReader() = default;

    /**
     * @param at block to read at, best block if unset
     */
    virtual outcome::result<primitives::ActiveEraInfo> activeEra(
        const std::optional<primitives::BlockHash> &at) = 0;

    /**
     * @return hash of canonical block with given number, NOT_FOUND if there
     * is no such block yet
     */
    virtual outcome::result<primitives::BlockHash> blockHash(
        primitives::BlockNumber number) = 0;

    virtual outcome::result<primitives::BlockHash> chainHead() = 0;

    virtual outcome::result<primitives::BlockHash> finalizedHead() = 0;

    virtual outcome::result<primitives::BlockNumber> blockNumber(
        const primitives::BlockHash &hash) = 0;

    /**
     * @return controller of the stash, none if the stash is not bonded
     */
    virtual outcome::result<std::optional<primitives::AccountId>>
    bondedController(const primitives::AccountId &stash,
                     const primitives::BlockHash &at) = 0;

    /**
     * @return ledger of the controller, none if there is no ledger
     */
    virtual outcome::result<std::optional<primitives::StakingLedger>> ledger(
        const primitives::AccountId &controller,
        const primitives::BlockHash &at) = 0;

    /**
     * @return number of prior slashing spans of the stash, 0 if never slashed
     */
    virtual outcome::result<uint32_t> slashingSpans(
        const primitives::AccountId &stash, const primitives::BlockHash &at) = 0;

    virtual outcome::result<AccountSet> validators(
        const primitives::BlockHash &at) = 0;

    virtual outcome::result<AccountSet> nominators(
        const primitives::BlockHash &at) = 0;

    /**
     * @return free balance, 0 for an account that does not exist
     */
    virtual outcome::result<primitives::Balance> freeBalance(
        const primitives::AccountId &account,
        const primitives::BlockHash &at) = 0;
  };

}  // namespace eraoracle::relay

OUTCOME_HPP_DECLARE_ERROR(eraoracle::relay, ChainReaderError);
