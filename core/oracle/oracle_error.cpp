/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "oracle/oracle_error.hpp"

#include "relay/chain_reader.hpp"
#include "relay/era_boundary_locator.hpp"
#include "rpc/endpoint_pool.hpp"
#include "rpc/rpc_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::oracle, OracleError, e) {
  using E = eraoracle::oracle::OracleError;
  switch (e) {
    case E::WATCHDOG_EXPIRED:
      return "Era update is delayed beyond tolerance";
    case E::STOPPED:
      return "Oracle was stopped";
  }
  return "Unknown OracleError";
}

namespace eraoracle::oracle {

  ErrorClass classify(const std::error_code &ec, bool starting) {
    if (ec == OracleError::STOPPED or ec == rpc::EndpointPoolError::STOPPED
        or ec == relay::EraLocatorError::STOPPED) {
      return ErrorClass::Stopped;
    }
    if (ec == OracleError::WATCHDOG_EXPIRED
        or ec == rpc::EndpointPoolError::NO_URLS) {
      return ErrorClass::Fatal;
    }
    if (ec == relay::EraLocatorError::BOUNDARY_NOT_FOUND
        or ec == relay::ChainReaderError::NOT_FOUND) {
      return ErrorClass::BoundaryNotFound;
    }
    if (rpc::isConnectivityError(ec)) {
      return ErrorClass::Transient;
    }
    return starting ? ErrorClass::Fatal : ErrorClass::Transient;
  }

}  // namespace eraoracle::oracle
