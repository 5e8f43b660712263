/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "relay/era_boundary_locator.hpp"

#include <chrono>
#include <memory>

#include "clock/sleeper.hpp"
#include "log/logger.hpp"

namespace eraoracle::relay {

  class EraBoundaryLocatorImpl final : public EraBoundaryLocator {
   public:
    struct Config {
      /// width of the search window
      primitives::BlockNumber era_duration_in_blocks = 3600;
      /// interval between finalized head polls
      std::chrono::milliseconds finality_poll_interval{6000};
    };

    EraBoundaryLocatorImpl(Config config,
                           std::shared_ptr<clock::Sleeper> sleeper);

    outcome::result<primitives::BlockInfo> locate(
        ChainReader &reader,
        primitives::EraIndex era,
        primitives::BlockNumber head) override;

    outcome::result<void> waitFinalized(
        ChainReader &reader, const primitives::BlockInfo &boundary) override;

   private:
    struct Probe {
      primitives::BlockHash hash;
      primitives::EraIndex era;
    };

    outcome::result<Probe> probe(ChainReader &reader,
                                 primitives::BlockNumber number);

    Config config_;
    std::shared_ptr<clock::Sleeper> sleeper_;
    log::Logger log_;
  };

}  // namespace eraoracle::relay
