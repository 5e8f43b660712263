/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>
#include <sodium.h>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/oracle_application_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using eraoracle::application::AppConfigurationImpl;
using eraoracle::application::OracleApplicationImpl;

namespace {
  int run_oracle(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>(
        eraoracle::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    eraoracle::log::tuneLoggingSystem(configuration->log());

    auto logger =
        eraoracle::log::createLogger("Main", eraoracle::log::defaultGroupName);

    auto app = std::make_shared<OracleApplicationImpl>(configuration);

    SL_INFO(logger, "Era oracle started");

    auto exit_code = app->run();

    SL_INFO(logger, "Era oracle stopped");
    logger->flush();

    return exit_code;
  }
}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("era_oracle");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        eraoracle::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto oracle_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<eraoracle::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<eraoracle::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(oracle_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  eraoracle::log::setLoggingSystem(logging_system);

  if (sodium_init() < 0) {
    std::cerr << "libsodium can not be initialized\n";
    return EXIT_FAILURE;
  }

  auto exit_code = run_oracle(argc, argv);

  auto logger =
      eraoracle::log::createLogger("Main", eraoracle::log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
