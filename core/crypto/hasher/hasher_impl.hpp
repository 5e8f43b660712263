/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace eraoracle::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash64 twox_64(common::BufferView data) const override;

    Hash128 twox_128(common::BufferView data) const override;

    Hash128 blake2b_128(common::BufferView data) const override;
  };

}  // namespace eraoracle::crypto
