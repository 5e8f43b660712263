/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/sleeper.hpp"

#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace eraoracle::clock {

  class SleeperImpl final : public Sleeper {
   public:
    SleeperImpl() = default;

    bool sleepFor(Duration duration) override;

    void pause(Duration duration) override;

    bool stopRequested() const override;

    void requestStop() override;

   private:
    std::stop_source stop_source_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
  };

}  // namespace eraoracle::clock
