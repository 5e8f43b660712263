/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "rpc/rpc_connection.hpp"

namespace eraoracle::rpc {

  /**
   * Establishes connections to endpoints selected by the pool
   */
  class Connector {
   public:
    virtual ~Connector() = default;

    virtual outcome::result<std::shared_ptr<RpcConnection>> connect(
        const std::string &url) = 0;
  };

}  // namespace eraoracle::rpc
