/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/staking.hpp"

namespace eraoracle::primitives {

  std::string_view toString(StakeStatus status) {
    switch (status) {
      case StakeStatus::Idle:
        return "idle";
      case StakeStatus::Nominator:
        return "nominator";
      case StakeStatus::Validator:
        return "validator";
      case StakeStatus::None:
        return "none";
    }
    return "unknown";
  }

}  // namespace eraoracle::primitives
