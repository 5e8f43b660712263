/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/ethereum_api.hpp"

namespace eraoracle::parachain {

  /**
   * Produces a signed raw transaction on behalf of the oracle account. The
   * key itself never reaches the oracle process.
   */
  class TransactionSigner {
   public:
    virtual ~TransactionSigner() = default;

    virtual outcome::result<common::Buffer> sign(
        const TransactionRequest &request) = 0;
  };

}  // namespace eraoracle::parachain
