/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/impl/oracle_contract_impl.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "mock/parachain/ethereum_api_mock.hpp"
#include "rpc/rpc_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using eraoracle::common::Buffer;
using eraoracle::common::BufferView;
using eraoracle::parachain::ContractError;
using eraoracle::parachain::EthereumApiMock;
using eraoracle::parachain::OracleContractImpl;
using eraoracle::primitives::AccountId;
using eraoracle::primitives::EvmAddress;
using eraoracle::primitives::StakeStatus;
using eraoracle::primitives::StakingSnapshot;
using eraoracle::primitives::UnlockChunk;
using eraoracle::rpc::RpcError;
using testing::_;
using testing::Invoke;
using testing::Return;

namespace {
  /// Hex of a 32-byte big-endian word holding `value`
  std::string word(uint64_t value) {
    auto digits = fmt::format("{:x}", value);
    return std::string(64 - digits.size(), '0') + digits;
  }

  std::string word(const AccountId &account) {
    return account.toHex();
  }

  Buffer words(std::initializer_list<std::string> list) {
    std::string hex;
    for (auto &item : list) {
      hex += item;
    }
    return eraoracle::common::unhex(hex).value();
  }

  std::string wordAt(const Buffer &call_data, size_t index) {
    constexpr size_t kSelectorSize = 4;
    return eraoracle::common::hex_lower(
        BufferView{call_data}.subspan(kSelectorSize + index * 32, 32));
  }

  EvmAddress makeAddress(uint8_t byte) {
    EvmAddress address;
    address.fill(byte);
    return address;
  }
}  // namespace

class OracleContractTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    api = std::make_shared<EthereumApiMock>();
    contract = std::make_shared<OracleContractImpl>(
        api, contract_address, oracle_account, true);
  }

  /// Expects a call with the given selector, replies with `reply`
  void expectCall(std::string_view selector, Buffer reply) {
    EXPECT_CALL(*api, call(oracle_account, contract_address, _))
        .WillOnce(Invoke([this, selector = std::string{selector}, reply](
                             auto &, auto &, BufferView data)
                             -> outcome::result<Buffer> {
          last_call = Buffer(data.begin(), data.end());
          EXPECT_EQ(eraoracle::common::hex_lower(data.first(4)), selector);
          return reply;
        }));
  }

  EvmAddress contract_address = makeAddress(0xcc);
  EvmAddress oracle_account = makeAddress(0x0a);
  std::shared_ptr<EthereumApiMock> api;
  std::shared_ptr<OracleContractImpl> contract;
  Buffer last_call;
};

/**
 * @given address with and without deployed code
 * @when contract is verified
 * @then missing code is NO_CONTRACT_CODE
 */
TEST_F(OracleContractTest, Verify) {
  EXPECT_CALL(*api, getCode(contract_address))
      .WillOnce(Return(Buffer{"6080604052"_unhex}))
      .WillOnce(Return(Buffer{}));
  EXPECT_OUTCOME_TRUE_1(contract->verify());
  EXPECT_EC(contract->verify(), ContractError::NO_CONTRACT_CODE);
}

/**
 * @given contract with two stashes
 * @when stash accounts are read
 * @then both are returned in order
 */
TEST_F(OracleContractTest, GetStashAccounts) {
  auto first = makeAccount(0x11);
  auto second = makeAccount(0x22);
  expectCall("1d55fde4",
             words({word(0x20), word(2), word(first), word(second)}));

  EXPECT_OUTCOME_TRUE(stashes, contract->getStashAccounts());
  EXPECT_EQ(stashes, (std::vector<AccountId>{first, second}));
  EXPECT_EQ(last_call.size(), 4);
}

/**
 * @given contract returning garbage
 * @when stash accounts are read
 * @then MALFORMED_RESULT is returned
 */
TEST_F(OracleContractTest, MalformedStashAccounts) {
  expectCall("1d55fde4", "0102"_unhex);
  EXPECT_EC(contract->getStashAccounts(), ContractError::MALFORMED_RESULT);
}

/**
 * @given contract announcing more stashes than it returns
 * @when stash accounts are read
 * @then MALFORMED_RESULT is returned
 */
TEST_F(OracleContractTest, TruncatedStashAccounts) {
  expectCall("1d55fde4",
             words({word(0x20), word(3), word(makeAccount(0x11))}));
  EXPECT_EC(contract->getStashAccounts(), ContractError::MALFORMED_RESULT);
}

/**
 * @given stash reported in era 41
 * @when reported era is read
 * @then call carries oracle account and stash, result is decoded
 */
TEST_F(OracleContractTest, IsReportedLastEra) {
  auto stash = makeAccount(0x33);
  expectCall("5e6f8df3", words({word(41), word(1)}));

  EXPECT_OUTCOME_TRUE(reported, contract->isReportedLastEra(stash));
  EXPECT_EQ(reported.era, 41);
  EXPECT_TRUE(reported.reported);
  EXPECT_EQ(wordAt(last_call, 0),
            std::string(24, '0') + oracle_account.toHex());
  EXPECT_EQ(wordAt(last_call, 1), word(stash));
}

/**
 * @given reported flag outside of bool range and an era beyond u32
 * @when reported era is read
 * @then MALFORMED_RESULT is returned
 */
TEST_F(OracleContractTest, MalformedReportedEra) {
  auto stash = makeAccount(0x33);
  expectCall("5e6f8df3", words({word(41), word(2)}));
  EXPECT_EC(contract->isReportedLastEra(stash),
            ContractError::MALFORMED_RESULT);

  expectCall("5e6f8df3", words({word(1ull << 40), word(0)}));
  EXPECT_EC(contract->isReportedLastEra(stash),
            ContractError::MALFORMED_RESULT);
}

/**
 * @given rpc failure during a call
 * @when reported era is read
 * @then the rpc error is propagated
 */
TEST_F(OracleContractTest, CallErrorPropagates) {
  EXPECT_CALL(*api, call(_, _, _)).WillOnce(Return(RpcError::TIMEOUT));
  EXPECT_EC(contract->isReportedLastEra(makeAccount(1)), RpcError::TIMEOUT);
}

/**
 * @given contracts with and without coordinator
 * @when coordinator era is read
 * @then era is decoded or NO_COORDINATOR is returned
 */
TEST_F(OracleContractTest, CoordinatorEra) {
  expectCall("3f109d23", words({word(1200)}));
  EXPECT_TRUE(contract->hasCoordinator());
  EXPECT_OUTCOME_TRUE(era, contract->coordinatorEra());
  EXPECT_EQ(era, 1200);

  OracleContractImpl plain{api, contract_address, oracle_account, false};
  EXPECT_FALSE(plain.hasCoordinator());
  EXPECT_EC(plain.coordinatorEra(), ContractError::NO_COORDINATOR);
}

/**
 * @given snapshot with one unlocking chunk
 * @when report is encoded
 * @then layout follows reportRelay(uint64,tuple) with relative offsets
 */
TEST_F(OracleContractTest, EncodeReport) {
  StakingSnapshot snapshot{
      .stash = makeAccount(0x01),
      .controller = makeAccount(0x02),
      .status = StakeStatus::Validator,
      .active_balance = 1000,
      .total_balance = 1500,
      .unlocking = {UnlockChunk{.value = 500, .era = 77}},
      .free_balance = 2000,
      .slashing_spans = 3,
  };

  auto data = contract->encodeReport(76, snapshot);

  ASSERT_EQ(data.size(), 4 + 32 * (2 + 9 + 3 + 1));
  EXPECT_EQ(eraoracle::common::hex_lower(BufferView{data}.first(4)),
            "79292235");
  EXPECT_EQ(wordAt(data, 0), word(76));
  EXPECT_EQ(wordAt(data, 1), word(0x40));
  // tuple starts at word 2, offsets are relative to it
  EXPECT_EQ(wordAt(data, 2), word(makeAccount(0x01)));
  EXPECT_EQ(wordAt(data, 3), word(makeAccount(0x02)));
  EXPECT_EQ(wordAt(data, 4), word(2));
  EXPECT_EQ(wordAt(data, 5), word(1000));
  EXPECT_EQ(wordAt(data, 6), word(1500));
  // unlocking
  EXPECT_EQ(wordAt(data, 7), word(10 * 32));
  // claimedRewards
  EXPECT_EQ(wordAt(data, 8), word(9 * 32));
  EXPECT_EQ(wordAt(data, 9), word(2000));
  EXPECT_EQ(wordAt(data, 10), word(3));
  EXPECT_EQ(wordAt(data, 11), word(0));
  EXPECT_EQ(wordAt(data, 12), word(1));
  EXPECT_EQ(wordAt(data, 13), word(500));
  EXPECT_EQ(wordAt(data, 14), word(77));
}

/**
 * @given snapshot of an unbonded stash
 * @when report is encoded
 * @then stash is used as controller
 */
TEST_F(OracleContractTest, EncodeUnbondedReport) {
  StakingSnapshot snapshot{.stash = makeAccount(0x05),
                           .controller = std::nullopt,
                           .status = StakeStatus::None};
  auto data = contract->encodeReport(10, snapshot);
  EXPECT_EQ(wordAt(data, 3), word(makeAccount(0x05)));
  EXPECT_EQ(wordAt(data, 4), word(3));
}
