/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/storage_keys.hpp"

#include <boost/assert.hpp>

#include "relay/chain_reader.hpp"

namespace eraoracle::relay {

  namespace {
    common::BufferView bytes(std::string_view str) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
    }
  }  // namespace

  StorageKeys::StorageKeys(std::shared_ptr<crypto::Hasher> hasher)
      : hasher_{std::move(hasher)} {
    BOOST_ASSERT(hasher_ != nullptr);
  }

  common::Buffer StorageKeys::prefix(std::string_view pallet,
                                     std::string_view item) const {
    common::Buffer key;
    auto pallet_hash = hasher_->twox_128(bytes(pallet));
    auto item_hash = hasher_->twox_128(bytes(item));
    key.insert(key.end(), pallet_hash.begin(), pallet_hash.end());
    key.insert(key.end(), item_hash.begin(), item_hash.end());
    return key;
  }

  common::Buffer StorageKeys::twox64Concat(
      common::Buffer key, const primitives::AccountId &account) const {
    auto hash = hasher_->twox_64(account);
    key.insert(key.end(), hash.begin(), hash.end());
    key.insert(key.end(), account.begin(), account.end());
    return key;
  }

  common::Buffer StorageKeys::blake2_128Concat(
      common::Buffer key, const primitives::AccountId &account) const {
    auto hash = hasher_->blake2b_128(account);
    key.insert(key.end(), hash.begin(), hash.end());
    key.insert(key.end(), account.begin(), account.end());
    return key;
  }

  common::Buffer StorageKeys::activeEra() const {
    return prefix("Staking", "ActiveEra");
  }

  common::Buffer StorageKeys::validators() const {
    return prefix("Session", "Validators");
  }

  common::Buffer StorageKeys::bonded(const primitives::AccountId &stash) const {
    return twox64Concat(prefix("Staking", "Bonded"), stash);
  }

  common::Buffer StorageKeys::ledger(
      const primitives::AccountId &controller) const {
    return blake2_128Concat(prefix("Staking", "Ledger"), controller);
  }

  common::Buffer StorageKeys::nominatorsPrefix() const {
    return prefix("Staking", "Nominators");
  }

  common::Buffer StorageKeys::slashingSpans(
      const primitives::AccountId &stash) const {
    return twox64Concat(prefix("Staking", "SlashingSpans"), stash);
  }

  common::Buffer StorageKeys::account(
      const primitives::AccountId &account) const {
    return blake2_128Concat(prefix("System", "Account"), account);
  }

  outcome::result<primitives::AccountId> StorageKeys::twox64ConcatAccount(
      common::BufferView full_key) {
    constexpr size_t kPrefixSize = 32 + 8;
    if (full_key.size() != kPrefixSize + primitives::AccountId::size()) {
      return ChainReaderError::MALFORMED_RESPONSE;
    }
    return primitives::AccountId::fromSpan(full_key.subspan(kPrefixSize));
  }

}  // namespace eraoracle::relay
