/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "primitives/common.hpp"

namespace eraoracle::application {

  /**
   * Parsed and validated configuration of the oracle. Read once at startup.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return websocket urls of relay chain nodes, in order of preference
     */
    virtual const std::vector<std::string> &relayUrls() const = 0;

    /**
     * @return websocket urls of parachain nodes, in order of preference
     */
    virtual const std::vector<std::string> &paraUrls() const = 0;

    /**
     * @return url of the node holding the oracle key, none to sign through
     * the parachain connection
     */
    virtual const std::optional<std::string> &signerUrl() const = 0;

    virtual const primitives::EvmAddress &contractAddress() const = 0;

    virtual const primitives::EvmAddress &oracleAccount() const = 0;

    /**
     * @return path to the json ABI of the oracle contract
     */
    virtual const std::filesystem::path &abiPath() const = 0;

    virtual primitives::BlockNumber eraDurationInBlocks() const = 0;

    virtual std::chrono::seconds eraDuration() const = 0;

    /// Timeout of a single rpc call and pause between endpoint pool passes
    virtual std::chrono::seconds timeout() const = 0;

    /// Failures of an endpoint after which the rotation avoids it
    virtual uint32_t maxFailures() const = 0;

    virtual std::chrono::seconds pollInterval() const = 0;

    virtual std::chrono::seconds eraDelayTolerance() const = 0;

    virtual std::chrono::seconds watchdogGrace() const = 0;

    virtual uint64_t gasLimit() const = 0;

    virtual uint64_t maxPriorityFeePerGas() const = 0;

    virtual uint64_t blocksToWait() const = 0;

    /**
     * @return true if reports are only built and dry-run
     */
    virtual bool debugMode() const = 0;

    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace eraoracle::application
