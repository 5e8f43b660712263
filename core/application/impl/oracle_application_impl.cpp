/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/oracle_application_impl.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include "clock/impl/clock_impl.hpp"
#include "clock/impl/sleeper_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "oracle/impl/report_builder_impl.hpp"
#include "oracle/impl/tx_submitter_impl.hpp"
#include "oracle/oracle_engine.hpp"
#include "parachain/contract_abi.hpp"
#include "parachain/impl/ethereum_api_impl.hpp"
#include "parachain/impl/node_transaction_signer.hpp"
#include "parachain/impl/oracle_contract_impl.hpp"
#include "relay/impl/chain_reader_impl.hpp"
#include "relay/impl/era_boundary_locator_impl.hpp"
#include "rpc/impl/ws_connector.hpp"

namespace eraoracle::application {

  std::atomic_bool OracleApplicationImpl::signals_enabled{false};
  std::weak_ptr<clock::Sleeper> OracleApplicationImpl::wp_to_sleeper;

  void OracleApplicationImpl::signalsEnable() {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = shuttingDownSignalsHandler;
    sigemptyset(&act.sa_mask);
    sigaddset(&act.sa_mask, SIGINT);
    sigaddset(&act.sa_mask, SIGTERM);
    sigaddset(&act.sa_mask, SIGQUIT);
    sigprocmask(SIG_BLOCK, &act.sa_mask, nullptr);
    sigaction(SIGINT, &act, nullptr);
    sigaction(SIGTERM, &act, nullptr);
    sigaction(SIGQUIT, &act, nullptr);
    signals_enabled.store(true);
    sigprocmask(SIG_UNBLOCK, &act.sa_mask, nullptr);
  }

  void OracleApplicationImpl::signalsDisable() {
    auto expected = true;
    if (not signals_enabled.compare_exchange_strong(expected, false)) {
      return;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = SIG_DFL;
    sigaction(SIGINT, &act, nullptr);
    sigaction(SIGTERM, &act, nullptr);
    sigaction(SIGQUIT, &act, nullptr);
  }

  void OracleApplicationImpl::shuttingDownSignalsHandler(int) {
    signalsDisable();
    if (auto sleeper = wp_to_sleeper.lock()) {
      sleeper->requestStop();
    }
  }

  OracleApplicationImpl::OracleApplicationImpl(
      std::shared_ptr<const AppConfiguration> config)
      : config_{std::move(config)},
        sleeper_{std::make_shared<clock::SleeperImpl>()},
        logger_{log::createLogger("OracleApplication", "application")} {
    wp_to_sleeper = sleeper_;
    signalsEnable();
    SL_TRACE(logger_, "Signal handler set up");
  }

  OracleApplicationImpl::~OracleApplicationImpl() {
    signalsDisable();
  }

  int OracleApplicationImpl::run() {
    auto abi_res = parachain::ContractAbi::load(config_->abiPath());
    if (abi_res.has_error()) {
      SL_CRITICAL(logger_,
                  "Contract ABI {} can not be loaded: {}",
                  config_->abiPath().string(),
                  abi_res.error().message());
      return EXIT_FAILURE;
    }
    auto &abi = abi_res.value();
    if (auto res = parachain::requireOracleFunctions(abi); res.has_error()) {
      SL_CRITICAL(logger_, "Contract ABI is incomplete: {}",
                  res.error().message());
      return EXIT_FAILURE;
    }
    const bool has_coordinator =
        abi.hasFunction(parachain::signatures::kEraId);
    if (not has_coordinator) {
      SL_INFO(logger_, "Contract has no eraId(), watchdog works locally");
    }

    const auto timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            config_->timeout());
    auto connector = std::make_shared<rpc::WsConnector>(timeout);

    auto relay_pool = std::make_shared<rpc::EndpointPool>(
        "relay",
        rpc::EndpointPool::Config{.urls = config_->relayUrls(),
                                  .max_failures = config_->maxFailures(),
                                  .retry_timeout = timeout},
        connector,
        sleeper_);
    auto para_pool = std::make_shared<rpc::EndpointPool>(
        "parachain",
        rpc::EndpointPool::Config{.urls = config_->paraUrls(),
                                  .max_failures = config_->maxFailures(),
                                  .retry_timeout = timeout},
        connector,
        sleeper_);

    auto hasher = std::make_shared<crypto::HasherImpl>();
    auto relay_provider =
        std::make_shared<oracle::PooledSessionProvider<oracle::RelaySession>>(
            relay_pool,
            [hasher](std::shared_ptr<rpc::RpcConnection> connection)
                -> outcome::result<std::shared_ptr<oracle::RelaySession>> {
              auto reader =
                  std::make_shared<relay::ChainReaderImpl>(connection, hasher);
              auto builder = std::make_shared<oracle::ReportBuilderImpl>(reader);
              return std::make_shared<oracle::RelaySession>(
                  oracle::RelaySession{.connection = std::move(connection),
                                       .reader = std::move(reader),
                                       .builder = std::move(builder)});
            });

    oracle::TxSubmitterImpl::Config submitter_config{
        .oracle_account = config_->oracleAccount(),
        .gas_limit = config_->gasLimit(),
        .max_priority_fee_per_gas = config_->maxPriorityFeePerGas(),
        .blocks_to_wait = config_->blocksToWait(),
        .debug = config_->debugMode(),
    };
    auto para_provider = std::make_shared<
        oracle::PooledSessionProvider<oracle::ParachainSession>>(
        para_pool,
        [config = config_,
         connector,
         submitter_config,
         has_coordinator,
         sleeper = sleeper_](std::shared_ptr<rpc::RpcConnection> connection)
            -> outcome::result<std::shared_ptr<oracle::ParachainSession>> {
          auto signer_connection = connection;
          if (config->signerUrl().has_value()) {
            OUTCOME_TRY(dedicated, connector->connect(*config->signerUrl()));
            signer_connection = std::move(dedicated);
          }
          auto api = std::make_shared<parachain::EthereumApiImpl>(connection);
          auto signer = std::make_shared<parachain::NodeTransactionSigner>(
              std::move(signer_connection));
          auto contract = std::make_shared<parachain::OracleContractImpl>(
              api,
              config->contractAddress(),
              config->oracleAccount(),
              has_coordinator);
          auto submitter = std::make_shared<oracle::TxSubmitterImpl>(
              submitter_config, api, contract, signer, sleeper);
          return std::make_shared<oracle::ParachainSession>(
              oracle::ParachainSession{.connection = std::move(connection),
                                       .contract = std::move(contract),
                                       .submitter = std::move(submitter)});
        });

    // finality is polled once per relay chain block
    const auto block_time = std::max<std::chrono::milliseconds>(
        std::chrono::milliseconds{1000},
        std::chrono::duration_cast<std::chrono::milliseconds>(
            config_->eraDuration())
            / config_->eraDurationInBlocks());
    auto locator = std::make_shared<relay::EraBoundaryLocatorImpl>(
        relay::EraBoundaryLocatorImpl::Config{
            .era_duration_in_blocks = config_->eraDurationInBlocks(),
            .finality_poll_interval = block_time},
        sleeper_);

    auto watchdog = std::make_shared<oracle::EraWatchdog>(
        oracle::EraWatchdog::Config{
            .era_duration = config_->eraDuration(),
            .update_delay_tolerance = config_->eraDelayTolerance(),
            .grace = std::chrono::duration_cast<std::chrono::milliseconds>(
                config_->watchdogGrace())},
        sleeper_);

    oracle::OracleEngine engine{
        oracle::OracleEngine::Config{
            .poll_interval =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    config_->pollInterval())},
        std::move(relay_provider),
        std::move(para_provider),
        std::move(locator),
        std::make_shared<oracle::ReportTracker>(),
        std::move(watchdog),
        std::make_shared<clock::SteadyClockImpl>(),
        sleeper_};

    SL_INFO(logger_,
            "Oracle {} of contract {}{}",
            config_->oracleAccount(),
            config_->contractAddress(),
            config_->debugMode() ? " in debug mode" : "");

    if (auto res = engine.run(); res.has_error()) {
      SL_CRITICAL(logger_, "Oracle is terminated: {}", res.error().message());
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  }

}  // namespace eraoracle::application
