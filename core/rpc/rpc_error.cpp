/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/rpc_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::rpc, RpcError, e) {
  using E = eraoracle::rpc::RpcError;
  switch (e) {
    case E::CONNECTION_FAILED:
      return "Connection to the node failed";
    case E::CONNECTION_CLOSED:
      return "Connection was closed by the node";
    case E::TIMEOUT:
      return "Request to the node timed out";
    case E::MALFORMED_RESPONSE:
      return "Node returned malformed json-rpc response";
    case E::REMOTE_ERROR:
      return "Node returned json-rpc error";
    case E::NOT_CONNECTED:
      return "Connection is not established";
  }
  return "Unknown RpcError";
}

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::rpc, EndpointUrlError, e) {
  using E = eraoracle::rpc::EndpointUrlError;
  switch (e) {
    case E::MALFORMED_URL:
      return "Url can not be parsed";
    case E::UNSUPPORTED_SCHEMA:
      return "Only ws and wss urls are supported";
    case E::HAS_FRAGMENT:
      return "Url must not have a fragment";
  }
  return "Unknown EndpointUrlError";
}

namespace eraoracle::rpc {

  bool isConnectivityError(const std::error_code &ec) {
    return ec == RpcError::CONNECTION_FAILED
        or ec == RpcError::CONNECTION_CLOSED or ec == RpcError::TIMEOUT
        or ec == RpcError::NOT_CONNECTED;
  }

}  // namespace eraoracle::rpc
