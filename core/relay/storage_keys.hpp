/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>

#include "common/buffer.hpp"
#include "crypto/hasher.hpp"
#include "primitives/common.hpp"

namespace eraoracle::relay {

  /**
   * Storage keys of relay chain pallets read by the oracle:
   * twox128(pallet) ++ twox128(item) ++ hashed map key
   */
  class StorageKeys {
   public:
    explicit StorageKeys(std::shared_ptr<crypto::Hasher> hasher);

    common::Buffer activeEra() const;

    common::Buffer validators() const;

    /// Twox64Concat(stash)
    common::Buffer bonded(const primitives::AccountId &stash) const;

    /// Blake2_128Concat(controller)
    common::Buffer ledger(const primitives::AccountId &controller) const;

    /// Prefix of all Staking::Nominators entries
    common::Buffer nominatorsPrefix() const;

    /// Twox64Concat(stash)
    common::Buffer slashingSpans(const primitives::AccountId &stash) const;

    /// Blake2_128Concat(account)
    common::Buffer account(const primitives::AccountId &account) const;

    /**
     * Extracts account id from the full key of a Twox64Concat map
     */
    static outcome::result<primitives::AccountId> twox64ConcatAccount(
        common::BufferView full_key);

   private:
    common::Buffer prefix(std::string_view pallet, std::string_view item) const;

    common::Buffer twox64Concat(common::Buffer key,
                                const primitives::AccountId &account) const;

    common::Buffer blake2_128Concat(
        common::Buffer key, const primitives::AccountId &account) const;

    std::shared_ptr<crypto::Hasher> hasher_;
  };

}  // namespace eraoracle::relay
