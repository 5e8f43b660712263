/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace eraoracle::crypto {

  using Hash64 = common::Blob<8>;
  using Hash128 = common::Hash128;

  /**
   * Hashers used by substrate storage key derivation
   */
  class Hasher {
   public:
    virtual ~Hasher() = default;

    /**
     * @brief twox_64 calculates 8-byte twox hash
     * @param data source data
     * @return 64-bit hash value
     */
    virtual Hash64 twox_64(common::BufferView data) const = 0;

    /**
     * @brief twox_128 calculates 16-byte twox hash
     * @param data source data
     * @return 128-bit hash value
     */
    virtual Hash128 twox_128(common::BufferView data) const = 0;

    /**
     * @brief blake2b_128 function calculates 16-byte blake2b hash
     * @param data source value
     * @return 128-bit hash value
     */
    virtual Hash128 blake2b_128(common::BufferView data) const = 0;
  };

}  // namespace eraoracle::crypto
