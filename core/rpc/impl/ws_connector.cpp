/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/impl/ws_connector.hpp"

#include "rpc/endpoint_url.hpp"
#include "rpc/impl/ws_rpc_connection.hpp"

namespace eraoracle::rpc {

  WsConnector::WsConnector(std::chrono::milliseconds timeout)
      : timeout_{timeout} {}

  outcome::result<std::shared_ptr<RpcConnection>> WsConnector::connect(
      const std::string &url) {
    OUTCOME_TRY(uri, parseEndpointUrl(url));
    auto connection =
        std::make_shared<WsRpcConnection>(std::move(uri), timeout_);
    OUTCOME_TRY(connection->connect());
    return connection;
  }

}  // namespace eraoracle::rpc
