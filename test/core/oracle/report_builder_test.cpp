/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "oracle/impl/report_builder_impl.hpp"

#include <gtest/gtest.h>

#include "mock/relay/chain_reader_mock.hpp"
#include "rpc/rpc_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using eraoracle::oracle::ReportBuilderImpl;
using eraoracle::primitives::AccountId;
using eraoracle::primitives::Balance;
using eraoracle::primitives::StakeStatus;
using eraoracle::primitives::StakingLedger;
using eraoracle::primitives::UnlockChunk;
using eraoracle::relay::AccountSet;
using eraoracle::relay::ChainReaderMock;
using eraoracle::rpc::RpcError;
using testing::_;
using testing::Return;

class ReportBuilderTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    reader = std::make_shared<testing::StrictMock<ChainReaderMock>>();
    builder = std::make_shared<ReportBuilderImpl>(reader);
  }

  /// Stash bonded to its controller with a ledger
  void expectBonded(const AccountId &stash, uint32_t spans) {
    auto controller = makeAccount(0xc0);
    EXPECT_CALL(*reader, freeBalance(stash, block))
        .WillOnce(Return(Balance{5000}));
    EXPECT_CALL(*reader, bondedController(stash, block))
        .WillOnce(Return(std::optional<AccountId>{controller}));
    StakingLedger ledger{.stash = stash,
                         .total = 3000,
                         .active = 2000,
                         .unlocking = {UnlockChunk{.value = 1000, .era = 12}},
                         .claimed_rewards = {}};
    EXPECT_CALL(*reader, ledger(controller, block))
        .WillOnce(Return(std::optional<StakingLedger>{ledger}));
    EXPECT_CALL(*reader, slashingSpans(stash, block)).WillOnce(Return(spans));
  }

  std::shared_ptr<testing::StrictMock<ChainReaderMock>> reader;
  std::shared_ptr<ReportBuilderImpl> builder;
  eraoracle::primitives::BlockHash block = makeBlockHash(100);
  AccountId nominator = makeAccount(1);
  AccountId validator = makeAccount(2);
  AccountId idle = makeAccount(3);
};

/**
 * @given nominator, validator and idle stashes at one block
 * @when their snapshots are built
 * @then statuses differ, staker sets are read once per block
 */
TEST_F(ReportBuilderTest, StatusFromStakerSets) {
  EXPECT_CALL(*reader, nominators(block))
      .WillOnce(Return(AccountSet{nominator}));
  EXPECT_CALL(*reader, validators(block))
      .WillOnce(Return(AccountSet{validator}));

  expectBonded(nominator, 0);
  EXPECT_OUTCOME_TRUE(first, builder->build(nominator, block));
  EXPECT_EQ(first.status, StakeStatus::Nominator);
  EXPECT_EQ(first.controller, makeAccount(0xc0));
  EXPECT_EQ(first.active_balance, 2000);
  EXPECT_EQ(first.total_balance, 3000);
  EXPECT_EQ(first.free_balance, 5000);
  EXPECT_EQ(first.unlocking,
            (std::vector<UnlockChunk>{{.value = 1000, .era = 12}}));

  expectBonded(validator, 2);
  EXPECT_OUTCOME_TRUE(second, builder->build(validator, block));
  EXPECT_EQ(second.status, StakeStatus::Validator);
  EXPECT_EQ(second.slashing_spans, 2);

  expectBonded(idle, 0);
  EXPECT_OUTCOME_TRUE(third, builder->build(idle, block));
  EXPECT_EQ(third.status, StakeStatus::Idle);
}

/**
 * @given stash without bonded controller
 * @when snapshot is built
 * @then status is None and no staking storage is read
 */
TEST_F(ReportBuilderTest, UnbondedStash) {
  EXPECT_CALL(*reader, freeBalance(idle, block))
      .WillOnce(Return(Balance{42}));
  EXPECT_CALL(*reader, bondedController(idle, block))
      .WillOnce(Return(std::optional<AccountId>{}));

  EXPECT_OUTCOME_TRUE(snapshot, builder->build(idle, block));
  EXPECT_EQ(snapshot.status, StakeStatus::None);
  EXPECT_EQ(snapshot.controller, std::nullopt);
  EXPECT_EQ(snapshot.free_balance, 42);
  EXPECT_EQ(snapshot.active_balance, 0);
}

/**
 * @given read failure in the middle of a snapshot
 * @when snapshot is built
 * @then the error is propagated
 */
TEST_F(ReportBuilderTest, ReadFailure) {
  EXPECT_CALL(*reader, freeBalance(idle, block))
      .WillOnce(Return(Balance{42}));
  EXPECT_CALL(*reader, bondedController(idle, block))
      .WillOnce(Return(RpcError::TIMEOUT));
  EXPECT_EC(builder->build(idle, block), RpcError::TIMEOUT);
}
