/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/assert.hpp>

#include "oracle/report_builder.hpp"
#include "oracle/tx_submitter.hpp"
#include "parachain/oracle_contract.hpp"
#include "relay/chain_reader.hpp"
#include "rpc/endpoint_pool.hpp"

namespace eraoracle::oracle {

  /// Collaborators bound to one relay chain connection
  struct RelaySession {
    std::shared_ptr<rpc::RpcConnection> connection;
    std::shared_ptr<relay::ChainReader> reader;
    std::shared_ptr<ReportBuilder> builder;
  };

  /// Collaborators bound to one parachain connection
  struct ParachainSession {
    std::shared_ptr<rpc::RpcConnection> connection;
    std::shared_ptr<parachain::OracleContract> contract;
    std::shared_ptr<TxSubmitter> submitter;
  };

  /**
   * Source of sessions of one chain. A failed session is dropped and a new
   * one is requested, so nothing is reconnected in place.
   */
  template <typename Session>
  class SessionProvider {
   public:
    virtual ~SessionProvider() = default;

    /**
     * Connects to an endpoint chosen by rotation. Blocks until a connection
     * is made or stop is requested.
     */
    virtual outcome::result<std::shared_ptr<Session>> connect() = 0;

    /// Counts a failure of the current endpoint
    virtual void recordFailure() = 0;

    /// Clears failures of the current endpoint after it served a request
    virtual void recordSuccess() = 0;

    virtual void resetFailures() = 0;

    virtual uint32_t failures() const = 0;

    virtual std::optional<std::string> currentUrl() const = 0;
  };

  template <typename Session>
  class PooledSessionProvider final : public SessionProvider<Session> {
   public:
    using Factory = std::function<outcome::result<std::shared_ptr<Session>>(
        std::shared_ptr<rpc::RpcConnection>)>;

    PooledSessionProvider(std::shared_ptr<rpc::EndpointPool> pool,
                          Factory factory)
        : pool_{std::move(pool)}, factory_{std::move(factory)} {
      BOOST_ASSERT(pool_ != nullptr);
      BOOST_ASSERT(factory_);
    }

    outcome::result<std::shared_ptr<Session>> connect() override {
      OUTCOME_TRY(connection, pool_->rotate());
      return factory_(std::move(connection));
    }

    void recordFailure() override {
      if (auto url = pool_->current()) {
        pool_->recordFailure(*url);
      }
    }

    void recordSuccess() override {
      if (auto url = pool_->current()) {
        pool_->recordSuccess(*url);
      }
    }

    void resetFailures() override {
      pool_->resetFailures();
    }

    uint32_t failures() const override {
      return pool_->totalFailures();
    }

    std::optional<std::string> currentUrl() const override {
      return pool_->current();
    }

   private:
    std::shared_ptr<rpc::EndpointPool> pool_;
    Factory factory_;
  };

}  // namespace eraoracle::oracle
