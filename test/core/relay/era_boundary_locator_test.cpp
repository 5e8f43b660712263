/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/impl/era_boundary_locator_impl.hpp"

#include <set>

#include <gtest/gtest.h>

#include "mock/relay/chain_reader_mock.hpp"
#include "rpc/rpc_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/manual_time.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using eraoracle::primitives::ActiveEraInfo;
using eraoracle::primitives::BlockHash;
using eraoracle::primitives::BlockInfo;
using eraoracle::primitives::BlockNumber;
using eraoracle::primitives::EraIndex;
using eraoracle::relay::ChainReaderError;
using eraoracle::relay::ChainReaderMock;
using eraoracle::relay::EraBoundaryLocatorImpl;
using eraoracle::relay::EraLocatorError;
using eraoracle::rpc::RpcError;
using testing::_;
using testing::Invoke;
using testing::Return;

namespace {
  BlockNumber numberOf(const BlockHash &hash) {
    return (BlockNumber{hash[28]} << 24) | (BlockNumber{hash[29]} << 16)
         | (BlockNumber{hash[30]} << 8) | BlockNumber{hash[31]};
  }
}  // namespace

class EraBoundaryLocatorTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    sleeper = std::make_shared<testutil::ManualSleeper>();
    ON_CALL(reader, blockHash(_))
        .WillByDefault(
            Invoke([this](BlockNumber n) -> outcome::result<BlockHash> {
              if (n >= eras.size() or missing.contains(n)) {
                return ChainReaderError::NOT_FOUND;
              }
              return makeBlockHash(n);
            }));
    ON_CALL(reader, activeEra(_))
        .WillByDefault(Invoke(
            [this](const std::optional<BlockHash> &at)
                -> outcome::result<ActiveEraInfo> {
              ++probes;
              auto n = numberOf(at.value());
              return ActiveEraInfo{.index = eras.at(n), .start = {}};
            }));
  }

  /// Chain whose blocks up to each bound, exclusively, are in the paired era
  void makeChain(std::vector<std::pair<BlockNumber, EraIndex>> segments) {
    eras.clear();
    for (auto &[end, era] : segments) {
      while (eras.size() < end) {
        eras.push_back(era);
      }
    }
  }

  EraBoundaryLocatorImpl makeLocator(BlockNumber window) {
    return EraBoundaryLocatorImpl{
        {.era_duration_in_blocks = window,
         .finality_poll_interval = std::chrono::seconds(6)},
        sleeper};
  }

  BlockNumber head() const {
    return static_cast<BlockNumber>(eras.size() - 1);
  }

  testing::NiceMock<ChainReaderMock> reader;
  std::shared_ptr<testutil::ManualSleeper> sleeper;
  std::vector<EraIndex> eras;
  std::set<BlockNumber> missing;
  size_t probes = 0;
};

/**
 * @given chain with eras 4, 5 and 6
 * @when boundaries of each era are located
 * @then the last block of the era is returned, head for the current era
 */
TEST_F(EraBoundaryLocatorTest, LocatesLastBlockOfEra) {
  makeChain({{300, 4}, {700, 5}, {1001, 6}});
  auto locator = makeLocator(3600);

  EXPECT_OUTCOME_TRUE(era4, locator.locate(reader, 4, head()));
  EXPECT_EQ(era4, (BlockInfo{299, makeBlockHash(299)}));

  EXPECT_OUTCOME_TRUE(era5, locator.locate(reader, 5, head()));
  EXPECT_EQ(era5.number, 699);

  EXPECT_OUTCOME_TRUE(era6, locator.locate(reader, 6, head()));
  EXPECT_EQ(era6.number, 1000);
}

/**
 * @given chains of 64 blocks with a single era change at every position
 * @when boundary of the first era is located
 * @then exactly the block before the change is found, in logarithmic probes
 */
TEST_F(EraBoundaryLocatorTest, EveryBoundaryPosition) {
  constexpr BlockNumber kBlocks = 64;
  auto locator = makeLocator(3600);
  for (BlockNumber boundary = 0; boundary < kBlocks; ++boundary) {
    makeChain({{boundary + 1, 1}, {kBlocks, 2}});
    probes = 0;
    EXPECT_OUTCOME_TRUE(found, locator.locate(reader, 1, head()));
    EXPECT_EQ(found.number, boundary);
    EXPECT_EQ(found.hash, makeBlockHash(boundary));
    EXPECT_LE(probes, 2 + 6);
  }
}

/**
 * @given era started after the head or ended before the search window
 * @when its boundary is located
 * @then BOUNDARY_NOT_FOUND is returned
 */
TEST_F(EraBoundaryLocatorTest, EraOutsideOfWindow) {
  makeChain({{300, 4}, {700, 5}, {1001, 6}});

  auto wide = makeLocator(3600);
  EXPECT_EC(wide.locate(reader, 7, head()),
            EraLocatorError::BOUNDARY_NOT_FOUND);

  auto narrow = makeLocator(200);
  EXPECT_EC(narrow.locate(reader, 5, head()),
            EraLocatorError::BOUNDARY_NOT_FOUND);
  EXPECT_OUTCOME_TRUE(era6, narrow.locate(reader, 6, head()));
  EXPECT_EQ(era6.number, 1000);
}

/**
 * @given era skipped by the chain
 * @when its boundary is located
 * @then BOUNDARY_NOT_FOUND is returned
 */
TEST_F(EraBoundaryLocatorTest, SkippedEra) {
  makeChain({{100, 4}, {200, 6}});
  auto locator = makeLocator(3600);
  EXPECT_EC(locator.locate(reader, 5, head()),
            EraLocatorError::BOUNDARY_NOT_FOUND);
}

/**
 * @given block inside of window is not available
 * @when the search probes it
 * @then BOUNDARY_NOT_FOUND is returned
 */
TEST_F(EraBoundaryLocatorTest, MissingBlock) {
  makeChain({{300, 4}, {700, 5}, {1001, 6}});
  missing.insert(500);
  auto locator = makeLocator(3600);
  EXPECT_EC(locator.locate(reader, 5, head()),
            EraLocatorError::BOUNDARY_NOT_FOUND);
}

/**
 * @given connection lost during the search
 * @when locate
 * @then connection error is returned as is
 */
TEST_F(EraBoundaryLocatorTest, ConnectionErrorPropagates) {
  makeChain({{300, 4}, {1001, 5}});
  EXPECT_CALL(reader, blockHash(_))
      .WillRepeatedly(Return(RpcError::CONNECTION_CLOSED));
  auto locator = makeLocator(3600);
  EXPECT_EC(locator.locate(reader, 4, head()), RpcError::CONNECTION_CLOSED);
}

class WaitFinalizedTest : public EraBoundaryLocatorTest {
 public:
  void SetUp() override {
    EraBoundaryLocatorTest::SetUp();
    makeChain({{700, 5}, {1001, 6}});
    ON_CALL(reader, finalizedHead()).WillByDefault(Invoke([this] {
      return outcome::result<BlockHash>{makeBlockHash(finalized)};
    }));
    ON_CALL(reader, blockNumber(_))
        .WillByDefault(Invoke([](const BlockHash &hash) {
          return outcome::result<BlockNumber>{numberOf(hash)};
        }));
  }

  BlockNumber finalized = 500;
};

/**
 * @given boundary above the finalized head
 * @when waiting for its finality
 * @then finalized head is polled until it passes the boundary
 */
TEST_F(WaitFinalizedTest, PollsUntilFinalized) {
  sleeper->on_sleep = [this](testutil::ManualSleeper &) { finalized += 150; };
  auto locator = makeLocator(3600);

  EXPECT_OUTCOME_TRUE_1(
      locator.waitFinalized(reader, {699, makeBlockHash(699)}));
  EXPECT_EQ(sleeper->sleeps.size(), 2);
  EXPECT_EQ(sleeper->sleeps[0], std::chrono::seconds(6));
}

/**
 * @given boundary replaced by re-org before finalization
 * @when it is finalized
 * @then BOUNDARY_NOT_FOUND is returned
 */
TEST_F(WaitFinalizedTest, ReorganizedBoundary) {
  finalized = 900;
  BlockHash stale = makeBlockHash(699);
  stale[1] = 0xff;
  auto locator = makeLocator(3600);

  EXPECT_EC(locator.waitFinalized(reader, {699, stale}),
            EraLocatorError::BOUNDARY_NOT_FOUND);
}

/**
 * @given finality stalls
 * @when stop is requested while waiting
 * @then STOPPED is returned
 */
TEST_F(WaitFinalizedTest, StopWhileWaiting) {
  sleeper->on_sleep = [](testutil::ManualSleeper &s) { s.requestStop(); };
  auto locator = makeLocator(3600);

  EXPECT_EC(locator.waitFinalized(reader, {699, makeBlockHash(699)}),
            EraLocatorError::STOPPED);
}
