/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "oracle/impl/report_builder_impl.hpp"

#include <boost/assert.hpp>

namespace eraoracle::oracle {

  ReportBuilderImpl::ReportBuilderImpl(
      std::shared_ptr<relay::ChainReader> reader)
      : reader_{std::move(reader)},
        log_{log::createLogger("ReportBuilder", "report_builder")} {
    BOOST_ASSERT(reader_ != nullptr);
  }

  outcome::result<std::reference_wrapper<const ReportBuilderImpl::StakerSets>>
  ReportBuilderImpl::stakerSets(const primitives::BlockHash &block_hash) {
    if (not sets_.has_value() or sets_->block_hash != block_hash) {
      sets_.reset();
      OUTCOME_TRY(nominators, reader_->nominators(block_hash));
      OUTCOME_TRY(validators, reader_->validators(block_hash));
      SL_DEBUG(log_,
               "Block {} has {} nominators and {} validators",
               block_hash,
               nominators.size(),
               validators.size());
      sets_.emplace(StakerSets{.block_hash = block_hash,
                               .nominators = std::move(nominators),
                               .validators = std::move(validators)});
    }
    return std::cref(*sets_);
  }

  outcome::result<primitives::StakingSnapshot> ReportBuilderImpl::build(
      const primitives::AccountId &stash,
      const primitives::BlockHash &block_hash) {
    primitives::StakingSnapshot snapshot;
    snapshot.stash = stash;

    OUTCOME_TRY(free_balance, reader_->freeBalance(stash, block_hash));
    snapshot.free_balance = free_balance;

    OUTCOME_TRY(controller, reader_->bondedController(stash, block_hash));
    if (not controller.has_value()) {
      SL_DEBUG(log_, "Stash {} is not bonded at {}", stash, block_hash);
      snapshot.status = primitives::StakeStatus::None;
      return snapshot;
    }
    snapshot.controller = controller;

    OUTCOME_TRY(ledger, reader_->ledger(*controller, block_hash));
    if (ledger.has_value()) {
      snapshot.active_balance = ledger->active;
      snapshot.total_balance = ledger->total;
      snapshot.unlocking = std::move(ledger->unlocking);
    }

    OUTCOME_TRY(spans, reader_->slashingSpans(stash, block_hash));
    snapshot.slashing_spans = spans;

    OUTCOME_TRY(sets, stakerSets(block_hash));
    if (sets.get().nominators.contains(stash)) {
      snapshot.status = primitives::StakeStatus::Nominator;
    } else if (sets.get().validators.contains(stash)) {
      snapshot.status = primitives::StakeStatus::Validator;
    } else {
      snapshot.status = primitives::StakeStatus::Idle;
    }

    SL_DEBUG(log_,
             "Stash {} at {}: {}, active {}, total {}",
             stash,
             block_hash,
             snapshot.status,
             snapshot.active_balance,
             snapshot.total_balance);
    return snapshot;
  }

}  // namespace eraoracle::oracle
