/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/impl/era_boundary_locator_impl.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::relay, EraLocatorError, e) {
  using E = eraoracle::relay::EraLocatorError;
  switch (e) {
    case E::BOUNDARY_NOT_FOUND:
      return "Era boundary block was not found";
    case E::STOPPED:
      return "Waiting for finality was interrupted by stop request";
  }
  return "Unknown EraLocatorError";
}

namespace eraoracle::relay {

  EraBoundaryLocatorImpl::EraBoundaryLocatorImpl(
      Config config, std::shared_ptr<clock::Sleeper> sleeper)
      : config_{config},
        sleeper_{std::move(sleeper)},
        log_{log::createLogger("EraBoundaryLocator", "era_locator")} {
    BOOST_ASSERT(sleeper_ != nullptr);
  }

  outcome::result<EraBoundaryLocatorImpl::Probe> EraBoundaryLocatorImpl::probe(
      ChainReader &reader, primitives::BlockNumber number) {
    auto hash = reader.blockHash(number);
    if (hash.has_error()) {
      if (hash.error() == ChainReaderError::NOT_FOUND) {
        SL_WARN(log_, "Block #{} is not available", number);
        return EraLocatorError::BOUNDARY_NOT_FOUND;
      }
      return hash.error();
    }
    auto era = reader.activeEra(hash.value());
    if (era.has_error()) {
      if (era.error() == ChainReaderError::NOT_FOUND) {
        SL_WARN(log_, "Active era is not set at block #{}", number);
        return EraLocatorError::BOUNDARY_NOT_FOUND;
      }
      return era.error();
    }
    SL_TRACE(log_, "Block #{} is in era {}", number, era.value().index);
    return Probe{hash.value(), era.value().index};
  }

  outcome::result<primitives::BlockInfo> EraBoundaryLocatorImpl::locate(
      ChainReader &reader,
      primitives::EraIndex era,
      primitives::BlockNumber head) {
    primitives::BlockNumber lo = head > config_.era_duration_in_blocks
                                   ? head - config_.era_duration_in_blocks
                                   : 0;
    primitives::BlockNumber hi = head;

    OUTCOME_TRY(lo_probe, probe(reader, lo));
    if (lo_probe.era > era) {
      SL_WARN(log_,
              "Era {} ended before block #{}, the start of search window",
              era,
              lo);
      return EraLocatorError::BOUNDARY_NOT_FOUND;
    }

    OUTCOME_TRY(hi_probe, probe(reader, hi));
    if (hi_probe.era == era) {
      return primitives::BlockInfo{hi, hi_probe.hash};
    }
    if (hi_probe.era < era) {
      SL_WARN(log_, "Era {} has not started by block #{}", era, hi);
      return EraLocatorError::BOUNDARY_NOT_FOUND;
    }

    // invariant: era(lo) <= era < era(hi)
    auto lo_hash = lo_probe.hash;
    auto lo_era = lo_probe.era;
    while (hi - lo > 1) {
      auto mid = lo + (hi - lo) / 2;
      OUTCOME_TRY(mid_probe, probe(reader, mid));
      if (mid_probe.era <= era) {
        lo = mid;
        lo_hash = mid_probe.hash;
        lo_era = mid_probe.era;
      } else {
        hi = mid;
      }
    }

    if (lo_era != era) {
      SL_WARN(log_, "No block of era {} in window ending at #{}", era, head);
      return EraLocatorError::BOUNDARY_NOT_FOUND;
    }

    primitives::BlockInfo boundary{lo, lo_hash};
    SL_INFO(log_, "Last block of era {} is {}", era, boundary);
    return boundary;
  }

  outcome::result<void> EraBoundaryLocatorImpl::waitFinalized(
      ChainReader &reader, const primitives::BlockInfo &boundary) {
    // No iteration cap: finality is waited out, not timed out
    while (true) {
      OUTCOME_TRY(finalized_hash, reader.finalizedHead());
      OUTCOME_TRY(finalized, reader.blockNumber(finalized_hash));
      if (finalized >= boundary.number) {
        break;
      }
      SL_DEBUG(log_,
               "Waiting for finalization of {}, finalized is #{}",
               boundary,
               finalized);
      if (not sleeper_->sleepFor(config_.finality_poll_interval)) {
        return EraLocatorError::STOPPED;
      }
    }

    auto hash = reader.blockHash(boundary.number);
    if (hash.has_error()) {
      if (hash.error() == ChainReaderError::NOT_FOUND) {
        return EraLocatorError::BOUNDARY_NOT_FOUND;
      }
      return hash.error();
    }
    if (hash.value() != boundary.hash) {
      SL_WARN(log_,
              "Block #{} was re-organized: {} replaced {}",
              boundary.number,
              hash.value(),
              boundary.hash);
      return EraLocatorError::BOUNDARY_NOT_FOUND;
    }
    return outcome::success();
  }

}  // namespace eraoracle::relay
