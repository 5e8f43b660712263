/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "clock/sleeper.hpp"
#include "log/logger.hpp"
#include "rpc/connector.hpp"

namespace eraoracle::rpc {

  enum class EndpointPoolError {
    STOPPED = 1,
    NO_URLS,
  };

  /**
   * Set of interchangeable endpoints of one chain with per-url failure
   * counters. Selection never gives up: when every url fails it sleeps and
   * starts over until a connection is made or stop is requested.
   */
  class EndpointPool {
   public:
    struct Config {
      std::vector<std::string> urls;
      /// failures after which a url is avoided by the next rotation
      uint32_t max_failures = 10;
      /// pause between two full passes over the pool
      std::chrono::milliseconds retry_timeout{60000};
    };

    EndpointPool(std::string name,
                 Config config,
                 std::shared_ptr<Connector> connector,
                 std::shared_ptr<clock::Sleeper> sleeper);

    /**
     * Connects to the first reachable url in list order, skipping the
     * undesirable ones. When a pass fails entirely the skipped urls are tried
     * right away, then the whole pool is retried after a pause.
     * @return connection, or STOPPED once stop is requested
     */
    outcome::result<std::shared_ptr<RpcConnection>> select(
        const std::set<std::string> &undesirable);

    /**
     * Select avoiding urls whose failure counter reached the threshold. Their
     * counters are reset, so exclusion lasts for one rotation only.
     */
    outcome::result<std::shared_ptr<RpcConnection>> rotate();

    void recordFailure(const std::string &url);

    void recordSuccess(const std::string &url);

    uint32_t failures(const std::string &url) const;

    /// Sum of failure counters over all urls
    uint32_t totalFailures() const;

    /// Urls whose failure counter reached the threshold
    std::set<std::string> undesirable() const;

    void resetFailures();

    /// Url of the last established connection
    std::optional<std::string> current() const;

    const std::string &name() const {
      return name_;
    }

   private:
    std::shared_ptr<RpcConnection> tryConnect(const std::string &url);

    const std::string name_;
    const Config config_;
    std::shared_ptr<Connector> connector_;
    std::shared_ptr<clock::Sleeper> sleeper_;

    mutable std::mutex mutex_;
    std::map<std::string, uint32_t> failures_;
    std::optional<std::string> current_;

    log::Logger log_;
  };

}  // namespace eraoracle::rpc

OUTCOME_HPP_DECLARE_ERROR(eraoracle::rpc, EndpointPoolError);
