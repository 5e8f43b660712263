/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/impl/chain_reader_impl.hpp"

#include <boost/assert.hpp>
#include <fmt/format.h>
#include <rapidjson/document.h>
#include <scale/scale.hpp>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::relay, ChainReaderError, e) {
  using E = eraoracle::relay::ChainReaderError;
  switch (e) {
    case E::NOT_FOUND:
      return "Requested block or storage value was not found";
    case E::DECODE_ERROR:
      return "Storage value can not be decoded";
    case E::MALFORMED_RESPONSE:
      return "Relay chain node returned unexpected value";
  }
  return "Unknown ChainReaderError";
}

namespace eraoracle::relay {

  namespace {
    outcome::result<rapidjson::Document> parse(const std::string &json) {
      rapidjson::Document document;
      document.Parse(json.data(), json.size());
      if (document.HasParseError()) {
        return ChainReaderError::MALFORMED_RESPONSE;
      }
      return document;
    }

    std::string quoted(const std::string &str) {
      return fmt::format("\"{}\"", str);
    }
  }  // namespace

  ChainReaderImpl::ChainReaderImpl(
      std::shared_ptr<rpc::RpcConnection> connection,
      std::shared_ptr<crypto::Hasher> hasher)
      : connection_{std::move(connection)},
        keys_{std::move(hasher)},
        log_{log::createLogger("ChainReader", "chain_reader")} {
    BOOST_ASSERT(connection_ != nullptr);
  }

  outcome::result<primitives::BlockHash> ChainReaderImpl::parseHash(
      const std::string &json) const {
    OUTCOME_TRY(document, parse(json));
    if (document.IsNull()) {
      return ChainReaderError::NOT_FOUND;
    }
    if (not document.IsString()) {
      return ChainReaderError::MALFORMED_RESPONSE;
    }
    auto hash = primitives::BlockHash::fromHexWithPrefix(
        {document.GetString(), document.GetStringLength()});
    if (hash.has_error()) {
      return ChainReaderError::MALFORMED_RESPONSE;
    }
    return hash.value();
  }

  outcome::result<std::optional<common::Buffer>> ChainReaderImpl::getStorage(
      const common::Buffer &key,
      const std::optional<primitives::BlockHash> &at) {
    auto params = at.has_value()
                    ? fmt::format("[{},{}]",
                                  quoted(common::hex_lower_0x(key)),
                                  quoted(at->toHexWithPrefix()))
                    : fmt::format("[{}]", quoted(common::hex_lower_0x(key)));
    OUTCOME_TRY(json, connection_->call("state_getStorage", params));
    OUTCOME_TRY(document, parse(json));
    if (document.IsNull()) {
      return std::nullopt;
    }
    if (not document.IsString()) {
      return ChainReaderError::MALFORMED_RESPONSE;
    }
    auto value = common::unhexWith0x(
        {document.GetString(), document.GetStringLength()});
    if (value.has_error()) {
      return ChainReaderError::MALFORMED_RESPONSE;
    }
    return std::move(value.value());
  }

  template <typename T>
  outcome::result<std::optional<T>> ChainReaderImpl::getDecoded(
      const common::Buffer &key,
      const std::optional<primitives::BlockHash> &at) {
    OUTCOME_TRY(raw, getStorage(key, at));
    if (not raw.has_value()) {
      return std::nullopt;
    }
    auto decoded = scale::decode<T>(*raw);
    if (decoded.has_error()) {
      SL_DEBUG(log_,
               "Can not decode storage value {}: {}",
               common::hex_lower_0x(key),
               decoded.error().message());
      return ChainReaderError::DECODE_ERROR;
    }
    return std::move(decoded.value());
  }

  outcome::result<primitives::ActiveEraInfo> ChainReaderImpl::activeEra(
      const std::optional<primitives::BlockHash> &at) {
    OUTCOME_TRY(info,
                getDecoded<primitives::ActiveEraInfo>(keys_.activeEra(), at));
    if (not info.has_value()) {
      return ChainReaderError::NOT_FOUND;
    }
    return *info;
  }

  outcome::result<primitives::BlockHash> ChainReaderImpl::blockHash(
      primitives::BlockNumber number) {
    OUTCOME_TRY(json,
                connection_->call("chain_getBlockHash",
                                  fmt::format("[{}]", number)));
    return parseHash(json);
  }

  outcome::result<primitives::BlockHash> ChainReaderImpl::chainHead() {
    OUTCOME_TRY(json, connection_->call("chain_getBlockHash", "[]"));
    return parseHash(json);
  }

  outcome::result<primitives::BlockHash> ChainReaderImpl::finalizedHead() {
    OUTCOME_TRY(json, connection_->call("chain_getFinalizedHead", "[]"));
    return parseHash(json);
  }

  outcome::result<primitives::BlockNumber> ChainReaderImpl::blockNumber(
      const primitives::BlockHash &hash) {
    OUTCOME_TRY(json,
                connection_->call(
                    "chain_getHeader",
                    fmt::format("[{}]", quoted(hash.toHexWithPrefix()))));
    OUTCOME_TRY(document, parse(json));
    if (document.IsNull()) {
      return ChainReaderError::NOT_FOUND;
    }
    if (not document.IsObject()) {
      return ChainReaderError::MALFORMED_RESPONSE;
    }
    auto it = document.FindMember("number");
    if (it == document.MemberEnd() or not it->value.IsString()) {
      return ChainReaderError::MALFORMED_RESPONSE;
    }
    auto number = common::unhexNumber<primitives::BlockNumber>(
        {it->value.GetString(), it->value.GetStringLength()});
    if (number.has_error()) {
      return ChainReaderError::MALFORMED_RESPONSE;
    }
    return number.value();
  }

  outcome::result<std::optional<primitives::AccountId>>
  ChainReaderImpl::bondedController(const primitives::AccountId &stash,
                                    const primitives::BlockHash &at) {
    return getDecoded<primitives::AccountId>(keys_.bonded(stash), at);
  }

  outcome::result<std::optional<primitives::StakingLedger>>
  ChainReaderImpl::ledger(const primitives::AccountId &controller,
                          const primitives::BlockHash &at) {
    return getDecoded<primitives::StakingLedger>(keys_.ledger(controller), at);
  }

  outcome::result<uint32_t> ChainReaderImpl::slashingSpans(
      const primitives::AccountId &stash, const primitives::BlockHash &at) {
    OUTCOME_TRY(spans,
                getDecoded<primitives::SlashingSpans>(
                    keys_.slashingSpans(stash), at));
    if (not spans.has_value()) {
      return uint32_t{0};
    }
    return static_cast<uint32_t>(spans->prior.size());
  }

  outcome::result<AccountSet> ChainReaderImpl::validators(
      const primitives::BlockHash &at) {
    OUTCOME_TRY(list,
                getDecoded<std::vector<primitives::AccountId>>(
                    keys_.validators(), at));
    AccountSet result;
    if (list.has_value()) {
      result.insert(list->begin(), list->end());
    }
    return result;
  }

  outcome::result<AccountSet> ChainReaderImpl::nominators(
      const primitives::BlockHash &at) {
    auto prefix = quoted(common::hex_lower_0x(keys_.nominatorsPrefix()));
    auto block = quoted(at.toHexWithPrefix());
    AccountSet result;
    std::string start_key = "null";

    while (true) {
      OUTCOME_TRY(json,
                  connection_->call("state_getKeysPaged",
                                    fmt::format("[{},{},{},{}]",
                                                prefix,
                                                kKeysPageSize,
                                                start_key,
                                                block)));
      OUTCOME_TRY(document, parse(json));
      if (not document.IsArray()) {
        return ChainReaderError::MALFORMED_RESPONSE;
      }
      for (auto &item : document.GetArray()) {
        if (not item.IsString()) {
          return ChainReaderError::MALFORMED_RESPONSE;
        }
        auto key =
            common::unhexWith0x({item.GetString(), item.GetStringLength()});
        if (key.has_error()) {
          return ChainReaderError::MALFORMED_RESPONSE;
        }
        OUTCOME_TRY(account, StorageKeys::twox64ConcatAccount(key.value()));
        result.insert(account);
      }
      if (document.Size() < kKeysPageSize) {
        break;
      }
      const auto &last = document[document.Size() - 1];
      start_key = quoted({last.GetString(), last.GetStringLength()});
    }

    SL_TRACE(log_, "{} nominators at {}", result.size(), at);
    return result;
  }

  outcome::result<primitives::Balance> ChainReaderImpl::freeBalance(
      const primitives::AccountId &account, const primitives::BlockHash &at) {
    OUTCOME_TRY(info,
                getDecoded<primitives::AccountInfo>(keys_.account(account), at));
    if (not info.has_value()) {
      return primitives::Balance{0};
    }
    return info->free;
  }

}  // namespace eraoracle::relay
