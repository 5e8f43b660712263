/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/impl/ethereum_api_impl.hpp"

#include <boost/assert.hpp>
#include <fmt/format.h>
#include <rapidjson/document.h>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::parachain, EthereumApiError, e) {
  using E = eraoracle::parachain::EthereumApiError;
  switch (e) {
    case E::MALFORMED_RESULT:
      return "Parachain node returned unexpected value";
  }
  return "Unknown EthereumApiError";
}

namespace eraoracle::parachain {

  namespace json {
    outcome::result<std::string> string(const std::string &json) {
      rapidjson::Document document;
      document.Parse(json.data(), json.size());
      if (document.HasParseError() or not document.IsString()) {
        return EthereumApiError::MALFORMED_RESULT;
      }
      return std::string{document.GetString(), document.GetStringLength()};
    }

    std::string quoted(std::string_view str) {
      return fmt::format("\"{}\"", str);
    }

    std::string transactionObject(const TransactionRequest &request) {
      return fmt::format(
          R"({{"from":"{}","to":"{}","data":"{}","nonce":"{}","gas":"{}",)"
          R"("maxFeePerGas":"{}","maxPriorityFeePerGas":"{}","chainId":"{}",)"
          R"("type":"0x2"}})",
          request.from.toHexWithPrefix(),
          request.to.toHexWithPrefix(),
          common::hex_lower_0x(request.data),
          common::hexNumber(request.nonce),
          common::hexNumber(request.gas),
          common::hexNumber(request.max_fee_per_gas),
          common::hexNumber(request.max_priority_fee_per_gas),
          common::hexNumber(request.chain_id));
    }
  }  // namespace json

  EthereumApiImpl::EthereumApiImpl(
      std::shared_ptr<rpc::RpcConnection> connection)
      : connection_{std::move(connection)} {
    BOOST_ASSERT(connection_ != nullptr);
  }

  outcome::result<std::string> EthereumApiImpl::callString(
      std::string_view method, std::string_view params) {
    OUTCOME_TRY(result, connection_->call(method, params));
    return json::string(result);
  }

  outcome::result<uint64_t> EthereumApiImpl::callQuantity(
      std::string_view method, std::string_view params) {
    OUTCOME_TRY(str, callString(method, params));
    auto value = common::unhexNumber<uint64_t>(str);
    if (value.has_error()) {
      return EthereumApiError::MALFORMED_RESULT;
    }
    return value.value();
  }

  outcome::result<common::Buffer> EthereumApiImpl::callData(
      std::string_view method, std::string_view params) {
    OUTCOME_TRY(str, callString(method, params));
    auto value = common::unhexWith0x(str);
    if (value.has_error()) {
      return EthereumApiError::MALFORMED_RESULT;
    }
    return std::move(value.value());
  }

  outcome::result<uint64_t> EthereumApiImpl::chainId() {
    return callQuantity("eth_chainId", "[]");
  }

  outcome::result<uint64_t> EthereumApiImpl::blockNumber() {
    return callQuantity("eth_blockNumber", "[]");
  }

  outcome::result<common::Buffer> EthereumApiImpl::getCode(
      const primitives::EvmAddress &address) {
    return callData(
        "eth_getCode",
        fmt::format(R"(["{}","latest"])", address.toHexWithPrefix()));
  }

  outcome::result<uint64_t> EthereumApiImpl::getTransactionCount(
      const primitives::EvmAddress &address) {
    return callQuantity(
        "eth_getTransactionCount",
        fmt::format(R"(["{}","pending"])", address.toHexWithPrefix()));
  }

  outcome::result<uint64_t> EthereumApiImpl::gasPrice() {
    return callQuantity("eth_gasPrice", "[]");
  }

  outcome::result<common::Buffer> EthereumApiImpl::call(
      const primitives::EvmAddress &from,
      const primitives::EvmAddress &to,
      common::BufferView data) {
    return callData(
        "eth_call",
        fmt::format(R"([{{"from":"{}","to":"{}","data":"{}"}},"latest"])",
                    from.toHexWithPrefix(),
                    to.toHexWithPrefix(),
                    common::hex_lower_0x(data)));
  }

  outcome::result<TxHash> EthereumApiImpl::sendRawTransaction(
      common::BufferView signed_tx) {
    OUTCOME_TRY(str,
                callString("eth_sendRawTransaction",
                           fmt::format("[{}]",
                                       json::quoted(common::hex_lower_0x(
                                           signed_tx)))));
    auto hash = TxHash::fromHexWithPrefix(str);
    if (hash.has_error()) {
      return EthereumApiError::MALFORMED_RESULT;
    }
    return hash.value();
  }

  outcome::result<std::optional<TransactionReceipt>>
  EthereumApiImpl::getTransactionReceipt(const TxHash &hash) {
    OUTCOME_TRY(result,
                connection_->call(
                    "eth_getTransactionReceipt",
                    fmt::format("[{}]", json::quoted(hash.toHexWithPrefix()))));
    rapidjson::Document document;
    document.Parse(result.data(), result.size());
    if (document.HasParseError()) {
      return EthereumApiError::MALFORMED_RESULT;
    }
    if (document.IsNull()) {
      return std::nullopt;
    }
    if (not document.IsObject()) {
      return EthereumApiError::MALFORMED_RESULT;
    }

    auto quantity = [&](const char *name) -> outcome::result<uint64_t> {
      auto it = document.FindMember(name);
      if (it == document.MemberEnd() or not it->value.IsString()) {
        return EthereumApiError::MALFORMED_RESULT;
      }
      auto value = common::unhexNumber<uint64_t>(
          {it->value.GetString(), it->value.GetStringLength()});
      if (value.has_error()) {
        return EthereumApiError::MALFORMED_RESULT;
      }
      return value.value();
    };

    TransactionReceipt receipt;
    receipt.transaction_hash = hash;
    OUTCOME_TRY(block_number, quantity("blockNumber"));
    OUTCOME_TRY(gas_used, quantity("gasUsed"));
    OUTCOME_TRY(status, quantity("status"));
    receipt.block_number = block_number;
    receipt.gas_used = gas_used;
    receipt.success = status == 1;
    return receipt;
  }

}  // namespace eraoracle::parachain
