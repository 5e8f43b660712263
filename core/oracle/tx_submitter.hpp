/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include <fmt/format.h>

#include "outcome/outcome.hpp"
#include "parachain/ethereum_api.hpp"
#include "primitives/staking.hpp"

namespace eraoracle::oracle {

  enum class TxOutcome {
    /// receipt with success status
    Success,
    /// receipt with failure status
    Reverted,
    /// dry-run failed, nothing was broadcast
    LikelyFailing,
    /// debug mode, report was built and dry-run only
    DebugBuilt,
  };

  std::string_view toString(TxOutcome outcome);

  /// Broadcast report whose receipt is not seen yet
  struct InFlightTx {
    primitives::AccountId stash;
    primitives::EraIndex era{};
    uint64_t nonce{};
    parachain::TxHash hash;

    bool operator==(const InFlightTx &) const = default;
  };

  /**
   * Sends reportRelay transactions of the oracle account
   */
  class TxSubmitter {
   public:
    virtual ~TxSubmitter() = default;

    /**
     * Submits the report and waits for its receipt. Connectivity errors are
     * returned as errors, failures of the dry-run are an outcome.
     * @param in_flight is set once the transaction is broadcast and reset
     * when its outcome is known, the caller keeps it across sessions. When it
     * holds the same stash and era, that transaction is awaited instead of a
     * new one, and it is sent again with the same nonce only if the node does
     * not know it.
     */
    virtual outcome::result<TxOutcome> submit(
        primitives::EraIndex era,
        const primitives::StakingSnapshot &snapshot,
        std::optional<InFlightTx> &in_flight) = 0;
  };

}  // namespace eraoracle::oracle

template <>
struct fmt::formatter<eraoracle::oracle::TxOutcome>
    : fmt::formatter<std::string_view> {
  auto format(eraoracle::oracle::TxOutcome outcome,
              format_context &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        eraoracle::oracle::toString(outcome), ctx);
  }
};
