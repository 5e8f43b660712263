/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "oracle/oracle_engine.hpp"

#include <gtest/gtest.h>

#include "mock/oracle/oracle_mocks.hpp"
#include "mock/parachain/oracle_contract_mock.hpp"
#include "mock/relay/chain_reader_mock.hpp"
#include "mock/relay/era_boundary_locator_mock.hpp"
#include "mock/rpc/rpc_connection_mock.hpp"
#include "parachain/oracle_contract.hpp"
#include "rpc/rpc_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/manual_time.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using eraoracle::oracle::EngineState;
using eraoracle::oracle::EraWatchdog;
using eraoracle::oracle::InFlightTx;
using eraoracle::oracle::OracleEngine;
using eraoracle::oracle::ParachainSession;
using eraoracle::oracle::PooledSessionProvider;
using eraoracle::oracle::RelaySession;
using eraoracle::oracle::ReportBuilderMock;
using eraoracle::oracle::ReportTracker;
using eraoracle::oracle::SessionProviderMock;
using eraoracle::oracle::TxOutcome;
using eraoracle::oracle::TxSubmitterMock;
using eraoracle::parachain::ContractError;
using eraoracle::parachain::OracleContractMock;
using eraoracle::parachain::ReportedEra;
using eraoracle::parachain::TxHash;
using eraoracle::primitives::AccountId;
using eraoracle::primitives::ActiveEraInfo;
using eraoracle::primitives::BlockInfo;
using eraoracle::primitives::EraIndex;
using eraoracle::primitives::StakingSnapshot;
using eraoracle::relay::ChainReaderMock;
using eraoracle::relay::EraBoundaryLocatorMock;
using eraoracle::relay::EraLocatorError;
using eraoracle::rpc::ConnectorMock;
using eraoracle::rpc::EndpointPool;
using eraoracle::rpc::RpcConnection;
using eraoracle::rpc::RpcConnectionMock;
using eraoracle::rpc::RpcError;
using testing::_;
using testing::Invoke;
using testing::NiceMock;
using testing::Optional;
using testing::Return;
using testing::ReturnRef;

namespace {
  ActiveEraInfo eraInfo(EraIndex index) {
    return ActiveEraInfo{.index = index, .start = {}};
  }
}  // namespace

class OracleEngineTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    clock = std::make_shared<testutil::ManualClock>();
    sleeper = std::make_shared<testutil::ManualSleeper>(clock);

    relay_connection = std::make_shared<NiceMock<RpcConnectionMock>>(
        "ws://relay.node:9944");
    reader = std::make_shared<NiceMock<ChainReaderMock>>();
    builder = std::make_shared<NiceMock<ReportBuilderMock>>();
    relay_session = std::make_shared<RelaySession>(
        RelaySession{relay_connection, reader, builder});

    para_connection = std::make_shared<NiceMock<RpcConnectionMock>>(
        "ws://para.node:9944");
    contract = std::make_shared<NiceMock<OracleContractMock>>();
    submitter = std::make_shared<NiceMock<TxSubmitterMock>>();
    para_session = std::make_shared<ParachainSession>(
        ParachainSession{para_connection, contract, submitter});

    relay_provider =
        std::make_shared<NiceMock<SessionProviderMock<RelaySession>>>();
    para_provider =
        std::make_shared<NiceMock<SessionProviderMock<ParachainSession>>>();
    ON_CALL(*relay_provider, connect()).WillByDefault(Return(relay_session));
    ON_CALL(*para_provider, connect()).WillByDefault(Return(para_session));

    locator = std::make_shared<NiceMock<EraBoundaryLocatorMock>>();
    tracker = std::make_shared<ReportTracker>();
    watchdog = std::make_shared<EraWatchdog>(EraWatchdog::Config{}, sleeper);

    ON_CALL(*contract, verify()).WillByDefault(Return(outcome::success()));
    ON_CALL(*contract, getStashAccounts())
        .WillByDefault(Return(std::vector<AccountId>{stash}));
    ON_CALL(*contract, isReportedLastEra(stash))
        .WillByDefault(Return(ReportedEra{.era = 3, .reported = true}));

    ON_CALL(*reader, chainHead()).WillByDefault(Return(makeBlockHash(5000)));
    ON_CALL(*reader, blockNumber(_)).WillByDefault(Return(5000));
    ON_CALL(*locator, locate(_, _, 5000))
        .WillByDefault(Invoke([](auto &, EraIndex era, auto) {
          return outcome::result<BlockInfo>{
              BlockInfo{era * 100, makeBlockHash(era * 100)}};
        }));
    ON_CALL(*locator, waitFinalized(_, _))
        .WillByDefault(Return(outcome::success()));
    ON_CALL(*builder, build(stash, _))
        .WillByDefault(Return(StakingSnapshot{.stash = stash}));
    ON_CALL(*submitter, submit(_, _, _))
        .WillByDefault(Return(TxOutcome::Success));

    engine = std::make_shared<OracleEngine>(
        OracleEngine::Config{.poll_interval = std::chrono::seconds(180)},
        relay_provider,
        para_provider,
        locator,
        tracker,
        watchdog,
        clock,
        sleeper);
  }

  /// Active era is read from the given sequence, then stays at its last value
  void setEras(std::vector<EraIndex> eras) {
    era_sequence = std::move(eras);
    ON_CALL(*reader, activeEra(_)).WillByDefault(Invoke([this](auto &) {
      auto index =
          era_sequence.at(std::min(era_cursor, era_sequence.size() - 1));
      ++era_cursor;
      return outcome::result<ActiveEraInfo>{eraInfo(index)};
    }));
  }

  /// Submission that broadcasts and then loses the connection
  auto broadcastThenDisconnect(InFlightTx tx) {
    return Invoke([tx](EraIndex,
                       const StakingSnapshot &,
                       std::optional<InFlightTx> &in_flight)
                      -> outcome::result<TxOutcome> {
      in_flight = tx;
      return RpcError::CONNECTION_CLOSED;
    });
  }

  AccountId stash = makeAccount(0x51);

  std::shared_ptr<testutil::ManualClock> clock;
  std::shared_ptr<testutil::ManualSleeper> sleeper;
  std::shared_ptr<NiceMock<RpcConnectionMock>> relay_connection;
  std::shared_ptr<NiceMock<ChainReaderMock>> reader;
  std::shared_ptr<NiceMock<ReportBuilderMock>> builder;
  std::shared_ptr<RelaySession> relay_session;
  std::shared_ptr<NiceMock<RpcConnectionMock>> para_connection;
  std::shared_ptr<NiceMock<OracleContractMock>> contract;
  std::shared_ptr<NiceMock<TxSubmitterMock>> submitter;
  std::shared_ptr<ParachainSession> para_session;
  std::shared_ptr<NiceMock<SessionProviderMock<RelaySession>>> relay_provider;
  std::shared_ptr<NiceMock<SessionProviderMock<ParachainSession>>>
      para_provider;
  std::shared_ptr<NiceMock<EraBoundaryLocatorMock>> locator;
  std::shared_ptr<ReportTracker> tracker;
  std::shared_ptr<EraWatchdog> watchdog;
  std::shared_ptr<OracleEngine> engine;

  std::vector<EraIndex> era_sequence;
  size_t era_cursor = 0;
};

/**
 * @given active era observed as 5, 5, 5, 7, 6, 8
 * @when polled once per observation
 * @then eras 5, 7 and 8 are processed, each reporting the previous era
 */
TEST_F(OracleEngineTest, ProcessesStrictIncreaseOnly) {
  setEras({5, 5, 5, 7, 6, 8});
  EXPECT_CALL(*submitter, submit(4, _, _))
      .WillOnce(Return(TxOutcome::Success));
  EXPECT_CALL(*submitter, submit(6, _, _))
      .WillOnce(Return(TxOutcome::Success));
  EXPECT_CALL(*submitter, submit(7, _, _))
      .WillOnce(Return(TxOutcome::Success));

  EXPECT_OUTCOME_TRUE_1(engine->start());
  for (size_t i = 0; i < 6; ++i) {
    EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  }

  EXPECT_EQ(engine->lastProcessedEra(), 8);
  EXPECT_EQ(tracker->lastReported(stash), 7);
  auto status = engine->status();
  EXPECT_EQ(status.state, EngineState::Monitoring);
  EXPECT_EQ(status.active_era, 8);
  EXPECT_EQ(status.last_reported_era, 7);
  EXPECT_EQ(status.last_boundary, 700);
  EXPECT_EQ(status.tx_success, 3);
}

/**
 * @given restart after era 4 was already reported on chain
 * @when active era 5 is observed
 * @then nothing is submitted and the era counts as processed
 */
TEST_F(OracleEngineTest, IdempotentAfterRestart) {
  setEras({5});
  EXPECT_CALL(*contract, isReportedLastEra(stash))
      .WillOnce(Return(ReportedEra{.era = 4, .reported = true}));
  EXPECT_CALL(*submitter, submit(_, _, _)).Times(0);
  EXPECT_CALL(*locator, locate(_, _, _)).Times(0);

  EXPECT_OUTCOME_TRUE_1(engine->start());
  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(engine->lastProcessedEra(), 5);
}

/**
 * @given era 4 recorded on chain but not flagged as reported
 * @when active era 5 is observed
 * @then era 4 is re-attempted
 */
TEST_F(OracleEngineTest, UnflaggedEraIsRetried) {
  setEras({5});
  EXPECT_CALL(*contract, isReportedLastEra(stash))
      .WillOnce(Return(ReportedEra{.era = 4, .reported = false}));
  EXPECT_CALL(*submitter, submit(4, _, _))
      .WillOnce(Return(TxOutcome::Success));

  EXPECT_OUTCOME_TRUE_1(engine->start());
  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(tracker->lastReported(stash), 4);
}

/**
 * @given report reverted on the first attempt
 * @when the same active era is polled again
 * @then tracker is unchanged after revert and the report is retried
 */
TEST_F(OracleEngineTest, RevertIsRetriedOnNextPoll) {
  setEras({5});
  EXPECT_CALL(*submitter, submit(4, _, _))
      .WillOnce(Return(TxOutcome::Reverted))
      .WillOnce(Return(TxOutcome::Success));

  EXPECT_OUTCOME_TRUE_1(engine->start());
  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(tracker->lastReported(stash), 3);
  EXPECT_EQ(engine->lastProcessedEra(), std::nullopt);
  EXPECT_EQ(engine->status().tx_reverted, 1);

  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(tracker->lastReported(stash), 4);
  EXPECT_EQ(engine->lastProcessedEra(), 5);
}

/**
 * @given debug mode submitter
 * @when era is processed
 * @then tracker is not advanced but the era is handled
 */
TEST_F(OracleEngineTest, DebugBuildDoesNotTouchTracker) {
  setEras({5});
  EXPECT_CALL(*submitter, submit(4, _, _))
      .WillOnce(Return(TxOutcome::DebugBuilt));

  EXPECT_OUTCOME_TRUE_1(engine->start());
  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(tracker->lastReported(stash), 3);
  EXPECT_EQ(engine->lastProcessedEra(), 5);
}

/**
 * @given contract without stashes and active era 0
 * @when polled
 * @then nothing is reported and eras are handled
 */
TEST_F(OracleEngineTest, NothingToReport) {
  setEras({0, 1});
  ON_CALL(*contract, getStashAccounts())
      .WillByDefault(Return(std::vector<AccountId>{}));
  EXPECT_CALL(*submitter, submit(_, _, _)).Times(0);

  EXPECT_OUTCOME_TRUE_1(engine->start());
  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(engine->lastProcessedEra(), 0);
  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(engine->lastProcessedEra(), 1);
}

/**
 * @given relay connection lost while reading active era
 * @when the error is handled
 * @then relay failure is recorded, session closed and reconnected on the
 * next poll without a pause
 */
TEST_F(OracleEngineTest, RecoversRelayConnection) {
  EXPECT_CALL(*relay_provider, connect()).Times(2);
  EXPECT_CALL(*relay_provider, recordFailure()).Times(1);
  EXPECT_CALL(*para_provider, recordFailure()).Times(0);
  EXPECT_CALL(*relay_connection, close()).Times(1);
  EXPECT_CALL(*reader, activeEra(_))
      .WillOnce(Return(RpcError::CONNECTION_CLOSED))
      .WillOnce(Return(eraInfo(5)));

  EXPECT_OUTCOME_TRUE_1(engine->start());
  auto res = engine->pollOnce();
  ASSERT_TRUE(res.has_error());
  EXPECT_OUTCOME_TRUE_1(engine->handleError(res.error()));
  EXPECT_EQ(engine->status().state, EngineState::Recovering);
  EXPECT_TRUE(sleeper->sleeps.empty());

  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(engine->lastProcessedEra(), 5);
}

/**
 * @given parachain connection lost during submission
 * @when the error is handled
 * @then parachain failure is recorded and the relay session is kept
 */
TEST_F(OracleEngineTest, RecoversParachainConnection) {
  setEras({5});
  EXPECT_CALL(*para_provider, connect()).Times(2);
  EXPECT_CALL(*relay_provider, connect()).Times(1);
  EXPECT_CALL(*para_provider, recordFailure()).Times(1);
  EXPECT_CALL(*relay_provider, recordFailure()).Times(0);
  EXPECT_CALL(*submitter, submit(4, _, _))
      .WillOnce(Return(RpcError::TIMEOUT))
      .WillOnce(Return(TxOutcome::Success));

  EXPECT_OUTCOME_TRUE_1(engine->start());
  auto res = engine->pollOnce();
  ASSERT_TRUE(res.has_error());
  EXPECT_OUTCOME_TRUE_1(engine->handleError(res.error()));

  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(tracker->lastReported(stash), 4);
}

/**
 * @given boundary not yet locatable
 * @when the error is handled
 * @then the era is deferred by a poll interval without reconnecting
 */
TEST_F(OracleEngineTest, BoundaryNotFoundDefersEra) {
  setEras({5});
  EXPECT_CALL(*locator, locate(_, 4, _))
      .WillOnce(Return(EraLocatorError::BOUNDARY_NOT_FOUND))
      .WillOnce(Return(BlockInfo{400, makeBlockHash(400)}));
  EXPECT_CALL(*relay_provider, recordFailure()).Times(0);

  EXPECT_OUTCOME_TRUE_1(engine->start());
  auto res = engine->pollOnce();
  EXPECT_EC(res, EraLocatorError::BOUNDARY_NOT_FOUND);
  EXPECT_OUTCOME_TRUE_1(engine->handleError(res.error()));
  ASSERT_EQ(sleeper->sleeps.size(), 1);
  EXPECT_EQ(sleeper->sleeps[0], std::chrono::seconds(180));

  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(engine->lastProcessedEra(), 5);
}

/**
 * @given contract without code
 * @when engine runs
 * @then it terminates with the startup error
 */
TEST_F(OracleEngineTest, FatalOnStartup) {
  EXPECT_CALL(*contract, verify())
      .WillOnce(Return(ContractError::NO_CONTRACT_CODE));

  EXPECT_EC(engine->run(), ContractError::NO_CONTRACT_CODE);
}

/**
 * @given running engine
 * @when stop is requested during the poll pause
 * @then run returns success and sessions are closed
 */
TEST_F(OracleEngineTest, StopsOnRequest) {
  setEras({5});
  sleeper->on_sleep = [](testutil::ManualSleeper &s) { s.requestStop(); };
  EXPECT_CALL(*relay_connection, close()).Times(1);
  EXPECT_CALL(*para_connection, close()).Times(1);

  EXPECT_OUTCOME_TRUE_1(engine->run());
  EXPECT_EQ(engine->lastProcessedEra(), 5);
}

/**
 * @given era stuck beyond watchdog tolerance and no coordinator
 * @when engine runs
 * @then it terminates with watchdog expiration
 */
TEST_F(OracleEngineTest, WatchdogExpires) {
  setEras({5});
  int cycles = 0;
  sleeper->on_sleep = [&cycles](testutil::ManualSleeper &) { ++cycles; };

  auto res = engine->run();
  EXPECT_EC(res, eraoracle::oracle::OracleError::WATCHDOG_EXPIRED);
  // 6h era and 3 min tolerance with 3 min polls, plus the grace sleep
  EXPECT_EQ(cycles, 122 + 1);
}

/**
 * @given report of era 4 broadcast, then the parachain connection is lost
 * while its receipt is awaited, and the contract shows era 4 reported
 * @when the era is processed again after reconnect
 * @then the contract record is read again and the report is not resubmitted
 */
TEST_F(OracleEngineTest, NoResubmissionOfReportSeenOnChain) {
  setEras({5});
  TxHash hash;
  hash.fill(0x77);
  EXPECT_CALL(*contract, isReportedLastEra(stash))
      .WillOnce(Return(ReportedEra{.era = 3, .reported = true}))
      .WillOnce(Return(ReportedEra{.era = 4, .reported = true}));
  EXPECT_CALL(*submitter, submit(4, _, _))
      .WillOnce(broadcastThenDisconnect(
          InFlightTx{.stash = stash, .era = 4, .nonce = 7, .hash = hash}));

  EXPECT_OUTCOME_TRUE_1(engine->start());
  auto res = engine->pollOnce();
  EXPECT_EC(res, RpcError::CONNECTION_CLOSED);
  EXPECT_OUTCOME_TRUE_1(engine->handleError(res.error()));

  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(tracker->lastReported(stash), 4);
  EXPECT_EQ(engine->lastProcessedEra(), 5);
}

/**
 * @given report of era 4 broadcast, then the parachain connection is lost
 * while its receipt is awaited, and the contract does not show it yet
 * @when the era is processed again after reconnect
 * @then the submitter is given the broadcast transaction to await
 */
TEST_F(OracleEngineTest, BroadcastReportIsAwaitedAfterReconnect) {
  setEras({5});
  TxHash hash;
  hash.fill(0x77);
  InFlightTx sent{.stash = stash, .era = 4, .nonce = 7, .hash = hash};
  EXPECT_CALL(*contract, isReportedLastEra(stash))
      .Times(2)
      .WillRepeatedly(Return(ReportedEra{.era = 3, .reported = true}));
  {
    testing::InSequence seq;
    EXPECT_CALL(*submitter, submit(4, _, _))
        .WillOnce(broadcastThenDisconnect(sent));
    EXPECT_CALL(*submitter, submit(4, _, Optional(sent)))
        .WillOnce(Invoke([](EraIndex,
                            const StakingSnapshot &,
                            std::optional<InFlightTx> &in_flight)
                             -> outcome::result<TxOutcome> {
          in_flight.reset();
          return TxOutcome::Success;
        }));
  }

  EXPECT_OUTCOME_TRUE_1(engine->start());
  auto res = engine->pollOnce();
  EXPECT_EC(res, RpcError::CONNECTION_CLOSED);
  EXPECT_OUTCOME_TRUE_1(engine->handleError(res.error()));

  EXPECT_OUTCOME_TRUE_1(engine->pollOnce());
  EXPECT_EQ(tracker->lastReported(stash), 4);
  EXPECT_EQ(engine->status().tx_success, 1);
}

/**
 * @given relay endpoint with a failure recorded after a lost connection
 * @when the next poll reads the active era from it
 * @then its failure counter is cleared
 */
TEST_F(OracleEngineTest, SuccessfulPollClearsEndpointFailures) {
  const std::string url = "ws://relay.node:9944";
  auto connector = std::make_shared<NiceMock<ConnectorMock>>();
  ON_CALL(*connector, connect(url))
      .WillByDefault(Invoke([](const std::string &url)
                                -> outcome::result<
                                    std::shared_ptr<RpcConnection>> {
        return std::make_shared<NiceMock<RpcConnectionMock>>(url);
      }));
  auto pool = std::make_shared<EndpointPool>(
      "relay", EndpointPool::Config{.urls = {url}}, connector, sleeper);
  auto pooled = std::make_shared<PooledSessionProvider<RelaySession>>(
      pool,
      [this](std::shared_ptr<RpcConnection>)
          -> outcome::result<std::shared_ptr<RelaySession>> {
        return relay_session;
      });
  OracleEngine pooled_engine{
      OracleEngine::Config{.poll_interval = std::chrono::seconds(180)},
      pooled,
      para_provider,
      locator,
      tracker,
      watchdog,
      clock,
      sleeper};

  EXPECT_CALL(*reader, activeEra(_))
      .WillOnce(Return(eraInfo(5)))
      .WillOnce(Return(RpcError::TIMEOUT))
      .WillOnce(Return(eraInfo(5)));
  EXPECT_CALL(*para_provider, recordSuccess()).Times(1);

  EXPECT_OUTCOME_TRUE_1(pooled_engine.start());
  EXPECT_OUTCOME_TRUE_1(pooled_engine.pollOnce());

  auto res = pooled_engine.pollOnce();
  EXPECT_EC(res, RpcError::TIMEOUT);
  EXPECT_OUTCOME_TRUE_1(pooled_engine.handleError(res.error()));
  EXPECT_EQ(pool->failures(url), 1);

  // era is unchanged, so failures are not reset by processing
  EXPECT_OUTCOME_TRUE_1(pooled_engine.pollOnce());
  EXPECT_EQ(pool->failures(url), 0);
  EXPECT_EQ(pooled_engine.status().relay_failures, 0);
}
