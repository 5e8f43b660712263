/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/impl/node_transaction_signer.hpp"

#include <boost/assert.hpp>
#include <fmt/format.h>
#include <rapidjson/document.h>

#include "common/hexutil.hpp"
#include "parachain/impl/ethereum_api_impl.hpp"

namespace eraoracle::parachain {

  NodeTransactionSigner::NodeTransactionSigner(
      std::shared_ptr<rpc::RpcConnection> connection)
      : connection_{std::move(connection)} {
    BOOST_ASSERT(connection_ != nullptr);
  }

  outcome::result<common::Buffer> NodeTransactionSigner::sign(
      const TransactionRequest &request) {
    OUTCOME_TRY(result,
                connection_->call(
                    "eth_signTransaction",
                    fmt::format("[{}]", json::transactionObject(request))));

    rapidjson::Document document;
    document.Parse(result.data(), result.size());
    if (document.HasParseError()) {
      return EthereumApiError::MALFORMED_RESULT;
    }

    // either raw transaction or {"raw": ..., "tx": {...}}
    const rapidjson::Value *raw = &document;
    if (document.IsObject()) {
      auto it = document.FindMember("raw");
      if (it == document.MemberEnd()) {
        return EthereumApiError::MALFORMED_RESULT;
      }
      raw = &it->value;
    }
    if (not raw->IsString()) {
      return EthereumApiError::MALFORMED_RESULT;
    }
    auto bytes = common::unhexWith0x({raw->GetString(), raw->GetStringLength()});
    if (bytes.has_error()) {
      return EthereumApiError::MALFORMED_RESULT;
    }
    return std::move(bytes.value());
  }

}  // namespace eraoracle::parachain
