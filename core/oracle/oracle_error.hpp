/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace eraoracle::oracle {

  enum class OracleError {
    /// era was not updated in time, process has to be restarted
    WATCHDOG_EXPIRED = 1,
    STOPPED,
  };

  /// How the engine reacts on an error
  enum class ErrorClass {
    /// reconnect to another endpoint of the failed chain
    Transient,
    /// defer the era to the next poll
    BoundaryNotFound,
    /// terminate with diagnostic
    Fatal,
    /// cooperative shutdown
    Stopped,
  };

  /**
   * Classifies an error of the oracle loop
   * @param starting errors of validated sources are fatal only on startup
   */
  ErrorClass classify(const std::error_code &ec, bool starting);

}  // namespace eraoracle::oracle

OUTCOME_HPP_DECLARE_ERROR(eraoracle::oracle, OracleError);
