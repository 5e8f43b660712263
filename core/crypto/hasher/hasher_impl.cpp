/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <sodium/crypto_generichash.h>
#include <xxhash.h>

namespace eraoracle::crypto {

  namespace {
    void put_le64(uint64_t value, uint8_t *out) {
      for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out[i] = static_cast<uint8_t>(value >> (8 * i));
      }
    }
  }  // namespace

  Hash64 HasherImpl::twox_64(common::BufferView data) const {
    Hash64 hash{};
    put_le64(XXH64(data.data(), data.size(), 0), hash.data());
    return hash;
  }

  Hash128 HasherImpl::twox_128(common::BufferView data) const {
    Hash128 hash{};
    put_le64(XXH64(data.data(), data.size(), 0), hash.data());
    put_le64(XXH64(data.data(), data.size(), 1), hash.data() + 8);
    return hash;
  }

  Hash128 HasherImpl::blake2b_128(common::BufferView data) const {
    Hash128 out;
    crypto_generichash(
        out.data(), out.size(), data.data(), data.size(), nullptr, 0);
    return out;
  }

}  // namespace eraoracle::crypto
