/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace eraoracle::common {

  using Buffer = std::vector<uint8_t>;
  using BufferView = std::span<const uint8_t>;

}  // namespace eraoracle::common
