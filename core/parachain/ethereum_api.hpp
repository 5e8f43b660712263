/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace eraoracle::parachain {

  enum class EthereumApiError {
    MALFORMED_RESULT = 1,
  };

  using TxHash = common::Hash256;

  /// EIP-1559 transaction to be signed
  struct TransactionRequest {
    primitives::EvmAddress from;
    primitives::EvmAddress to;
    common::Buffer data;
    uint64_t nonce = 0;
    uint64_t gas = 0;
    uint64_t max_fee_per_gas = 0;
    uint64_t max_priority_fee_per_gas = 0;
    uint64_t chain_id = 0;
  };

  struct TransactionReceipt {
    TxHash transaction_hash;
    uint64_t block_number = 0;
    uint64_t gas_used = 0;
    /// status field of the receipt, true for 0x1
    bool success = false;
  };

  /**
   * Ethereum compatible json-rpc of the parachain
   */
  class EthereumApi {
   public:
    virtual ~EthereumApi() = default;

    virtual outcome::result<uint64_t> chainId() = 0;

    virtual outcome::result<uint64_t> blockNumber() = 0;

    virtual outcome::result<common::Buffer> getCode(
        const primitives::EvmAddress &address) = 0;

    /// Nonce including pending transactions
    virtual outcome::result<uint64_t> getTransactionCount(
        const primitives::EvmAddress &address) = 0;

    virtual outcome::result<uint64_t> gasPrice() = 0;

    /**
     * Executes a message call at the latest block without creating a
     * transaction
     * @return return data; a revert is reported as an rpc error
     */
    virtual outcome::result<common::Buffer> call(
        const primitives::EvmAddress &from,
        const primitives::EvmAddress &to,
        common::BufferView data) = 0;

    virtual outcome::result<TxHash> sendRawTransaction(
        common::BufferView signed_tx) = 0;

    /// @return none while the transaction is not included yet
    virtual outcome::result<std::optional<TransactionReceipt>>
    getTransactionReceipt(const TxHash &hash) = 0;
  };

}  // namespace eraoracle::parachain

OUTCOME_HPP_DECLARE_ERROR(eraoracle::parachain, EthereumApiError);
