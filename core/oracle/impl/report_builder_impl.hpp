/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "oracle/report_builder.hpp"

#include <memory>
#include <optional>

#include "log/logger.hpp"
#include "relay/chain_reader.hpp"

namespace eraoracle::oracle {

  class ReportBuilderImpl final : public ReportBuilder {
   public:
    explicit ReportBuilderImpl(std::shared_ptr<relay::ChainReader> reader);

    outcome::result<primitives::StakingSnapshot> build(
        const primitives::AccountId &stash,
        const primitives::BlockHash &block_hash) override;

   private:
    /// Nominator and validator sets of one block
    struct StakerSets {
      primitives::BlockHash block_hash;
      relay::AccountSet nominators;
      relay::AccountSet validators;
    };

    outcome::result<std::reference_wrapper<const StakerSets>> stakerSets(
        const primitives::BlockHash &block_hash);

    std::shared_ptr<relay::ChainReader> reader_;
    std::optional<StakerSets> sets_;
    log::Logger log_;
  };

}  // namespace eraoracle::oracle
