/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "oracle/impl/tx_submitter_impl.hpp"

#include <boost/assert.hpp>

#include "rpc/rpc_error.hpp"

namespace eraoracle::oracle {

  std::string_view toString(TxOutcome outcome) {
    switch (outcome) {
      case TxOutcome::Success:
        return "success";
      case TxOutcome::Reverted:
        return "reverted";
      case TxOutcome::LikelyFailing:
        return "likely failing";
      case TxOutcome::DebugBuilt:
        return "built in debug mode";
    }
    return "unknown";
  }

  TxSubmitterImpl::TxSubmitterImpl(
      Config config,
      std::shared_ptr<parachain::EthereumApi> api,
      std::shared_ptr<parachain::OracleContract> contract,
      std::shared_ptr<parachain::TransactionSigner> signer,
      std::shared_ptr<clock::Sleeper> sleeper)
      : config_{std::move(config)},
        api_{std::move(api)},
        contract_{std::move(contract)},
        signer_{std::move(signer)},
        sleeper_{std::move(sleeper)},
        log_{log::createLogger("TxSubmitter", "tx_submitter")} {
    BOOST_ASSERT(api_ != nullptr);
    BOOST_ASSERT(contract_ != nullptr);
    BOOST_ASSERT(signer_ != nullptr);
    BOOST_ASSERT(sleeper_ != nullptr);
  }

  outcome::result<TxOutcome> TxSubmitterImpl::submit(
      primitives::EraIndex era,
      const primitives::StakingSnapshot &snapshot,
      std::optional<InFlightTx> &in_flight) {
    std::optional<uint64_t> resend_nonce;
    if (in_flight.has_value() and in_flight->stash == snapshot.stash
        and in_flight->era == era) {
      OUTCOME_TRY(resumed, resume(*in_flight));
      if (resumed.has_value()) {
        in_flight.reset();
        return resumed.value();
      }
      resend_nonce = in_flight->nonce;
    }

    uint64_t nonce = 0;
    if (resend_nonce.has_value()) {
      nonce = *resend_nonce;
    } else {
      OUTCOME_TRY(next_nonce,
                  api_->getTransactionCount(config_.oracle_account));
      nonce = next_nonce;
    }

    auto data = contract_->encodeReport(era, snapshot);

    if (auto res =
            api_->call(config_.oracle_account, contract_->address(), data);
        res.has_error()) {
      if (rpc::isConnectivityError(res.error())) {
        return res.error();
      }
      SL_WARN(log_,
              "Report of stash {} for era {} is likely failing: {}",
              snapshot.stash,
              era,
              res.error().message());
      return TxOutcome::LikelyFailing;
    }

    if (config_.debug) {
      SL_INFO(log_,
              "Debug mode: report of stash {} for era {} is built, "
              "status {}, active {}, nonce {}",
              snapshot.stash,
              era,
              snapshot.status,
              snapshot.active_balance,
              nonce);
      return TxOutcome::DebugBuilt;
    }

    if (not chain_id_.has_value()) {
      OUTCOME_TRY(chain_id, api_->chainId());
      chain_id_ = chain_id;
    }
    OUTCOME_TRY(gas_price, api_->gasPrice());

    parachain::TransactionRequest request{
        .from = config_.oracle_account,
        .to = contract_->address(),
        .data = std::move(data),
        .nonce = nonce,
        .gas = config_.gas_limit,
        .max_fee_per_gas = gas_price + config_.max_priority_fee_per_gas,
        .max_priority_fee_per_gas = config_.max_priority_fee_per_gas,
        .chain_id = *chain_id_,
    };

    OUTCOME_TRY(signed_tx, signer_->sign(request));
    OUTCOME_TRY(tx_hash, api_->sendRawTransaction(signed_tx));
    SL_INFO(log_,
            "Report of stash {} for era {} is sent in {} with nonce {}",
            snapshot.stash,
            era,
            tx_hash,
            nonce);
    in_flight = InFlightTx{
        .stash = snapshot.stash,
        .era = era,
        .nonce = nonce,
        .hash = tx_hash,
    };

    OUTCOME_TRY(receipt, waitReceipt(tx_hash));
    OUTCOME_TRY(tx_outcome, conclude(*in_flight, receipt));
    in_flight.reset();
    return tx_outcome;
  }

  outcome::result<std::optional<TxOutcome>> TxSubmitterImpl::resume(
      const InFlightTx &tx) {
    OUTCOME_TRY(receipt, api_->getTransactionReceipt(tx.hash));
    if (not receipt.has_value()) {
      OUTCOME_TRY(next_nonce,
                  api_->getTransactionCount(config_.oracle_account));
      if (next_nonce <= tx.nonce) {
        SL_WARN(log_,
                "Transaction {} of stash {} for era {} is unknown to the "
                "node, sent again with nonce {}",
                tx.hash,
                tx.stash,
                tx.era,
                tx.nonce);
        return std::optional<TxOutcome>{};
      }
      SL_INFO(log_,
              "Awaiting transaction {} of stash {} for era {} sent before",
              tx.hash,
              tx.stash,
              tx.era);
      OUTCOME_TRY(awaited, waitReceipt(tx.hash));
      receipt = std::move(awaited);
    }
    OUTCOME_TRY(tx_outcome, conclude(tx, *receipt));
    return std::optional<TxOutcome>{tx_outcome};
  }

  outcome::result<TxOutcome> TxSubmitterImpl::conclude(
      const InFlightTx &tx, const parachain::TransactionReceipt &receipt) {
    if (not receipt.success) {
      SL_WARN(log_,
              "Transaction {} of stash {} for era {} is reverted in block {}",
              tx.hash,
              tx.stash,
              tx.era,
              receipt.block_number);
      return TxOutcome::Reverted;
    }
    SL_INFO(log_,
            "Transaction {} is included in block {}, gas used {}",
            tx.hash,
            receipt.block_number,
            receipt.gas_used);

    OUTCOME_TRY(waitBlocks(receipt.block_number));
    return TxOutcome::Success;
  }

  outcome::result<parachain::TransactionReceipt> TxSubmitterImpl::waitReceipt(
      const parachain::TxHash &hash) {
    // in-flight transaction is awaited even if stop is requested
    while (true) {
      OUTCOME_TRY(receipt, api_->getTransactionReceipt(hash));
      if (receipt.has_value()) {
        return std::move(receipt.value());
      }
      SL_TRACE(log_, "Transaction {} is not included yet", hash);
      sleeper_->pause(config_.receipt_poll_interval);
    }
  }

  outcome::result<void> TxSubmitterImpl::waitBlocks(uint64_t receipt_block) {
    auto target = receipt_block + config_.blocks_to_wait;
    while (true) {
      OUTCOME_TRY(number, api_->blockNumber());
      if (number >= target) {
        return outcome::success();
      }
      sleeper_->pause(config_.receipt_poll_interval);
    }
  }

}  // namespace eraoracle::oracle
