/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace eraoracle::rpc {

  /**
   * Errors of a json-rpc round trip to a node
   */
  enum class RpcError {
    CONNECTION_FAILED = 1,
    CONNECTION_CLOSED,
    TIMEOUT,
    MALFORMED_RESPONSE,
    REMOTE_ERROR,
    NOT_CONNECTED,
  };

  /**
   * Reasons to reject an endpoint url before connecting to it
   */
  enum class EndpointUrlError {
    MALFORMED_URL = 1,
    UNSUPPORTED_SCHEMA,
    HAS_FRAGMENT,
  };

  /// Connection level failures, as opposed to protocol ones
  bool isConnectivityError(const std::error_code &ec);

}  // namespace eraoracle::rpc

OUTCOME_HPP_DECLARE_ERROR(eraoracle::rpc, RpcError);
OUTCOME_HPP_DECLARE_ERROR(eraoracle::rpc, EndpointUrlError);
