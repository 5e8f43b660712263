/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/oracle_contract.hpp"

#include <memory>

#include "log/logger.hpp"
#include "parachain/ethereum_api.hpp"

namespace eraoracle::parachain {

  class OracleContractImpl final : public OracleContract {
   public:
    /// Contract without code of at least this size is treated as absent
    static constexpr size_t kMinCodeSize = 3;

    OracleContractImpl(std::shared_ptr<EthereumApi> api,
                       primitives::EvmAddress address,
                       primitives::EvmAddress oracle_account,
                       bool has_coordinator);

    const primitives::EvmAddress &address() const override;

    outcome::result<void> verify() override;

    outcome::result<std::vector<primitives::AccountId>> getStashAccounts()
        override;

    outcome::result<ReportedEra> isReportedLastEra(
        const primitives::AccountId &stash) override;

    bool hasCoordinator() const override;

    outcome::result<primitives::EraIndex> coordinatorEra() override;

    common::Buffer encodeReport(
        primitives::EraIndex era,
        const primitives::StakingSnapshot &snapshot) const override;

   private:
    std::shared_ptr<EthereumApi> api_;
    primitives::EvmAddress address_;
    primitives::EvmAddress oracle_account_;
    bool has_coordinator_;
    log::Logger log_;
  };

}  // namespace eraoracle::parachain
