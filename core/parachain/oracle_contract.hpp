/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "parachain/contract_abi.hpp"
#include "primitives/staking.hpp"

namespace eraoracle::parachain {

  enum class ContractError {
    NO_CONTRACT_CODE = 1,
    MISSING_FUNCTION,
    MALFORMED_RESULT,
    NO_COORDINATOR,
  };

  /// Canonical signatures of contract functions used by the oracle
  namespace signatures {
    constexpr std::string_view kGetStashAccounts = "getStashAccounts()";
    constexpr std::string_view kIsReportedLastEra =
        "isReportedLastEra(address,bytes32)";
    constexpr std::string_view kReportRelay =
        "reportRelay(uint64,(bytes32,bytes32,uint8,uint128,uint128,"
        "(uint128,uint64)[],uint32[],uint128,uint32))";
    constexpr std::string_view kEraId = "eraId()";
  }  // namespace signatures

  /**
   * Checks that the ABI declares getStashAccounts, isReportedLastEra and
   * reportRelay
   * @return MISSING_FUNCTION, every missing function is logged
   */
  outcome::result<void> requireOracleFunctions(const ContractAbi &abi);

  /// Last era recorded by the contract for a stash of the oracle
  struct ReportedEra {
    primitives::EraIndex era{};
    bool reported = false;
  };

  /**
   * Oracle contract on the parachain
   */
  class OracleContract {
   public:
    virtual ~OracleContract() = default;

    virtual const primitives::EvmAddress &address() const = 0;

    /**
     * Checks that code is deployed at the contract address
     */
    virtual outcome::result<void> verify() = 0;

    virtual outcome::result<std::vector<primitives::AccountId>>
    getStashAccounts() = 0;

    virtual outcome::result<ReportedEra> isReportedLastEra(
        const primitives::AccountId &stash) = 0;

    /// Whether the contract exposes era of the oracle coordinator
    virtual bool hasCoordinator() const = 0;

    /**
     * Era as seen by the oracle coordinator
     * @return NO_COORDINATOR if the contract does not expose it
     */
    virtual outcome::result<primitives::EraIndex> coordinatorEra() = 0;

    /// Call data of reportRelay
    virtual common::Buffer encodeReport(
        primitives::EraIndex era,
        const primitives::StakingSnapshot &snapshot) const = 0;
  };

}  // namespace eraoracle::parachain

OUTCOME_HPP_DECLARE_ERROR(eraoracle::parachain, ContractError);
