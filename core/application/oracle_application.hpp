/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace eraoracle::application {

  /**
   * Oracle process: wires components from configuration and runs the engine
   */
  class OracleApplication {
   public:
    virtual ~OracleApplication() = default;

    /**
     * Runs until a termination signal or a fatal error
     * @return process exit code
     */
    virtual int run() = 0;
  };

}  // namespace eraoracle::application
