/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "relay/chain_reader.hpp"

#include <memory>

#include "log/logger.hpp"
#include "relay/storage_keys.hpp"
#include "rpc/rpc_connection.hpp"

namespace eraoracle::relay {

  /**
   * ChainReader over substrate json-rpc (state_*, chain_* methods)
   */
  class ChainReaderImpl final : public ChainReader {
   public:
    /// Page size of state_getKeysPaged
    static constexpr uint32_t kKeysPageSize = 1000;

    ChainReaderImpl(std::shared_ptr<rpc::RpcConnection> connection,
                    std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<primitives::ActiveEraInfo> activeEra(
        const std::optional<primitives::BlockHash> &at) override;

    outcome::result<primitives::BlockHash> blockHash(
        primitives::BlockNumber number) override;

    outcome::result<primitives::BlockHash> chainHead() override;

    outcome::result<primitives::BlockHash> finalizedHead() override;

    outcome::result<primitives::BlockNumber> blockNumber(
        const primitives::BlockHash &hash) override;

    outcome::result<std::optional<primitives::AccountId>> bondedController(
        const primitives::AccountId &stash,
        const primitives::BlockHash &at) override;

    outcome::result<std::optional<primitives::StakingLedger>> ledger(
        const primitives::AccountId &controller,
        const primitives::BlockHash &at) override;

    outcome::result<uint32_t> slashingSpans(
        const primitives::AccountId &stash,
        const primitives::BlockHash &at) override;

    outcome::result<AccountSet> validators(
        const primitives::BlockHash &at) override;

    outcome::result<AccountSet> nominators(
        const primitives::BlockHash &at) override;

    outcome::result<primitives::Balance> freeBalance(
        const primitives::AccountId &account,
        const primitives::BlockHash &at) override;

   private:
    /**
     * state_getStorage
     * @return raw value, none if storage has no value under the key
     */
    outcome::result<std::optional<common::Buffer>> getStorage(
        const common::Buffer &key,
        const std::optional<primitives::BlockHash> &at);

    template <typename T>
    outcome::result<std::optional<T>> getDecoded(
        const common::Buffer &key,
        const std::optional<primitives::BlockHash> &at);

    outcome::result<primitives::BlockHash> parseHash(
        const std::string &json) const;

    std::shared_ptr<rpc::RpcConnection> connection_;
    StorageKeys keys_;
    log::Logger log_;
  };

}  // namespace eraoracle::relay
