/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "oracle/report_builder.hpp"
#include "oracle/session_provider.hpp"
#include "oracle/tx_submitter.hpp"

#include <gmock/gmock.h>

namespace eraoracle::oracle {

  class ReportBuilderMock : public ReportBuilder {
   public:
    MOCK_METHOD(outcome::result<primitives::StakingSnapshot>,
                build,
                (const primitives::AccountId &, const primitives::BlockHash &),
                (override));
  };

  class TxSubmitterMock : public TxSubmitter {
   public:
    MOCK_METHOD(outcome::result<TxOutcome>,
                submit,
                (primitives::EraIndex,
                 const primitives::StakingSnapshot &,
                 std::optional<InFlightTx> &),
                (override));
  };

  template <typename Session>
  class SessionProviderMock : public SessionProvider<Session> {
   public:
    MOCK_METHOD(outcome::result<std::shared_ptr<Session>>,
                connect,
                (),
                (override));

    MOCK_METHOD(void, recordFailure, (), (override));

    MOCK_METHOD(void, recordSuccess, (), (override));

    MOCK_METHOD(void, resetFailures, (), (override));

    MOCK_METHOD(uint32_t, failures, (), (const, override));

    MOCK_METHOD(std::optional<std::string>, currentUrl, (), (const, override));
  };

}  // namespace eraoracle::oracle
