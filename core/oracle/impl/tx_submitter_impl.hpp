/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "oracle/tx_submitter.hpp"

#include <chrono>
#include <memory>
#include <optional>

#include "clock/sleeper.hpp"
#include "log/logger.hpp"
#include "parachain/ethereum_api.hpp"
#include "parachain/oracle_contract.hpp"
#include "parachain/transaction_signer.hpp"

namespace eraoracle::oracle {

  class TxSubmitterImpl final : public TxSubmitter {
   public:
    struct Config {
      primitives::EvmAddress oracle_account;
      uint64_t gas_limit = 10000000;
      uint64_t max_priority_fee_per_gas = 0;
      /// blocks to wait after a successful receipt
      uint64_t blocks_to_wait = 2;
      std::chrono::milliseconds receipt_poll_interval{6000};
      /// build and dry-run only
      bool debug = false;
    };

    TxSubmitterImpl(Config config,
                    std::shared_ptr<parachain::EthereumApi> api,
                    std::shared_ptr<parachain::OracleContract> contract,
                    std::shared_ptr<parachain::TransactionSigner> signer,
                    std::shared_ptr<clock::Sleeper> sleeper);

    outcome::result<TxOutcome> submit(
        primitives::EraIndex era,
        const primitives::StakingSnapshot &snapshot,
        std::optional<InFlightTx> &in_flight) override;

   private:
    /**
     * Awaits a transaction sent before
     * @return none if the node does not know the transaction and its nonce
     * is still free
     */
    outcome::result<std::optional<TxOutcome>> resume(const InFlightTx &tx);

    outcome::result<TxOutcome> conclude(
        const InFlightTx &tx, const parachain::TransactionReceipt &receipt);

    outcome::result<parachain::TransactionReceipt> waitReceipt(
        const parachain::TxHash &hash);

    outcome::result<void> waitBlocks(uint64_t receipt_block);

    const Config config_;
    std::shared_ptr<parachain::EthereumApi> api_;
    std::shared_ptr<parachain::OracleContract> contract_;
    std::shared_ptr<parachain::TransactionSigner> signer_;
    std::shared_ptr<clock::Sleeper> sleeper_;

    /// read once per parachain session
    std::optional<uint64_t> chain_id_;

    log::Logger log_;
  };

}  // namespace eraoracle::oracle
