/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "outcome/outcome.hpp"

namespace eraoracle::rpc {

  /**
   * Live json-rpc 2.0 session with a single node
   */
  class RpcConnection {
   public:
    virtual ~RpcConnection() = default;

    virtual const std::string &url() const = 0;

    /**
     * Performs a request and waits for its response
     * @param method json-rpc method name
     * @param params serialized json array of parameters
     * @return serialized json value of the `result` field
     */
    virtual outcome::result<std::string> call(std::string_view method,
                                              std::string_view params) = 0;

    /**
     * Gracefully closes the session. Further calls fail with NOT_CONNECTED.
     */
    virtual void close() = 0;
  };

}  // namespace eraoracle::rpc
