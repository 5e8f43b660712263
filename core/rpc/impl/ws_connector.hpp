/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "rpc/connector.hpp"

#include <chrono>

namespace eraoracle::rpc {

  /**
   * Opens WsRpcConnection for ws:// and wss:// urls
   */
  class WsConnector final : public Connector {
   public:
    explicit WsConnector(std::chrono::milliseconds timeout);

    outcome::result<std::shared_ptr<RpcConnection>> connect(
        const std::string &url) override;

   private:
    std::chrono::milliseconds timeout_;
  };

}  // namespace eraoracle::rpc
