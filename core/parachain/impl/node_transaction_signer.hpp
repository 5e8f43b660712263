/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/transaction_signer.hpp"

#include <memory>

#include "rpc/rpc_connection.hpp"

namespace eraoracle::parachain {

  /**
   * Signs with eth_signTransaction of a node that holds the oracle account
   * key (the parachain node itself or a dedicated signer)
   */
  class NodeTransactionSigner final : public TransactionSigner {
   public:
    explicit NodeTransactionSigner(
        std::shared_ptr<rpc::RpcConnection> connection);

    outcome::result<common::Buffer> sign(
        const TransactionRequest &request) override;

   private:
    std::shared_ptr<rpc::RpcConnection> connection_;
  };

}  // namespace eraoracle::parachain
