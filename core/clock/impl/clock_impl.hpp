/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace eraoracle::clock {

  class SteadyClockImpl final : public SteadyClock {
   public:
    TimePoint now() const override;
  };

}  // namespace eraoracle::clock
