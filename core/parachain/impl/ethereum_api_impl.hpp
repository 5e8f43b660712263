/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/ethereum_api.hpp"

#include <memory>
#include <string>

#include "rpc/rpc_connection.hpp"

namespace eraoracle::parachain {

  class EthereumApiImpl final : public EthereumApi {
   public:
    explicit EthereumApiImpl(std::shared_ptr<rpc::RpcConnection> connection);

    outcome::result<uint64_t> chainId() override;

    outcome::result<uint64_t> blockNumber() override;

    outcome::result<common::Buffer> getCode(
        const primitives::EvmAddress &address) override;

    outcome::result<uint64_t> getTransactionCount(
        const primitives::EvmAddress &address) override;

    outcome::result<uint64_t> gasPrice() override;

    outcome::result<common::Buffer> call(const primitives::EvmAddress &from,
                                         const primitives::EvmAddress &to,
                                         common::BufferView data) override;

    outcome::result<TxHash> sendRawTransaction(
        common::BufferView signed_tx) override;

    outcome::result<std::optional<TransactionReceipt>> getTransactionReceipt(
        const TxHash &hash) override;

   private:
    outcome::result<std::string> callString(std::string_view method,
                                            std::string_view params);

    outcome::result<uint64_t> callQuantity(std::string_view method,
                                           std::string_view params);

    outcome::result<common::Buffer> callData(std::string_view method,
                                             std::string_view params);

    std::shared_ptr<rpc::RpcConnection> connection_;
  };

  /**
   * Json helpers shared by the parachain adapters
   */
  namespace json {
    /// Parses json string value
    outcome::result<std::string> string(const std::string &json);

    std::string quoted(std::string_view str);

    /// Serializes the request as eth_signTransaction/eth_call parameter
    std::string transactionObject(const TransactionRequest &request);
  }  // namespace json

}  // namespace eraoracle::parachain
