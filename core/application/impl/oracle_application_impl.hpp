/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/oracle_application.hpp"

#include <atomic>
#include <memory>

#include "application/app_configuration.hpp"
#include "clock/sleeper.hpp"
#include "log/logger.hpp"

namespace eraoracle::application {

  class OracleApplicationImpl final : public OracleApplication {
   public:
    explicit OracleApplicationImpl(
        std::shared_ptr<const AppConfiguration> config);
    ~OracleApplicationImpl() override;

    int run() override;

   private:
    static void signalsEnable();
    static void signalsDisable();
    static void shuttingDownSignalsHandler(int);

    static std::atomic_bool signals_enabled;
    static std::weak_ptr<clock::Sleeper> wp_to_sleeper;

    std::shared_ptr<const AppConfiguration> config_;
    std::shared_ptr<clock::Sleeper> sleeper_;
    log::Logger logger_;
  };

}  // namespace eraoracle::application
