/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/impl/oracle_contract_impl.hpp"

#include <exception>
#include <ios>
#include <limits>
#include <string>
#include <vector>

#include <boost/assert.hpp>
#include <eth-utils/abi.hpp>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::parachain, ContractError, e) {
  using E = eraoracle::parachain::ContractError;
  switch (e) {
    case E::NO_CONTRACT_CODE:
      return "No contract code at the given address";
    case E::MISSING_FUNCTION:
      return "Contract ABI lacks a required function";
    case E::MALFORMED_RESULT:
      return "Contract returned data that can not be decoded";
    case E::NO_COORDINATOR:
      return "Contract does not expose coordinator era";
  }
  return "Unknown ContractError";
}

namespace eraoracle::parachain {

  namespace selectors {
    // keccak256 of the signatures from oracle_contract.hpp
    constexpr std::string_view kGetStashAccounts = "0x1d55fde4";
    constexpr std::string_view kIsReportedLastEra = "0x5e6f8df3";
    constexpr std::string_view kReportRelay = "0x79292235";
    constexpr std::string_view kEraId = "0x3f109d23";
  }  // namespace selectors

  namespace {

    constexpr size_t kWordSize = 32;
    /// stash, controller, status, active, total, unlocking, claimedRewards,
    /// free, slashingSpans
    constexpr size_t kLedgerHeadWords = 9;

    std::string withoutPrefix(const std::string &hex) {
      return hex.substr(2);
    }

    std::string balanceWord(const primitives::Balance &value) {
      auto digits = value.str(0, std::ios_base::hex);
      return "0x" + std::string(kWordSize * 2 - digits.size(), '0') + digits;
    }

    std::string uintWord(uint64_t value) {
      return ethutils::AbiEncoder::FormatInt(value);
    }

    std::string addressWord(const primitives::EvmAddress &address) {
      return "0x" + std::string((kWordSize - address.size()) * 2, '0')
           + address.toHex();
    }

    common::Buffer callData(std::string_view selector,
                            const std::string &arguments) {
      auto hex = std::string{selector};
      if (not arguments.empty()) {
        hex += withoutPrefix(arguments);
      }
      return common::unhexWith0x(hex).value();
    }

    outcome::result<primitives::EraIndex> readEra(ethutils::AbiDecoder &dec) {
      OUTCOME_TRY(era, common::unhexNumber<uint64_t>(dec.ReadUint(64)));
      if (era > std::numeric_limits<primitives::EraIndex>::max()) {
        return ContractError::MALFORMED_RESULT;
      }
      return static_cast<primitives::EraIndex>(era);
    }

    /// Runs the decoder over call result, any decoding failure is reported
    /// as MALFORMED_RESULT
    template <typename T, typename F>
    outcome::result<T> decodeResult(const log::Logger &log,
                                    std::string_view method,
                                    const common::Buffer &result,
                                    const F &read) {
      try {
        ethutils::AbiDecoder dec{common::hex_lower_0x(result)};
        auto value = read(dec);
        if (value.has_error()) {
          SL_WARN(log,
                  "{} returned malformed data: {}",
                  method,
                  value.error().message());
          return ContractError::MALFORMED_RESULT;
        }
        return std::move(value.value());
      } catch (const std::exception &e) {
        SL_WARN(log, "{} returned malformed data: {}", method, e.what());
        return ContractError::MALFORMED_RESULT;
      }
    }

  }  // namespace

  outcome::result<void> requireOracleFunctions(const ContractAbi &abi) {
    auto logger = log::createLogger("OracleContract", "oracle_contract");
    bool complete = true;
    for (auto signature : {signatures::kGetStashAccounts,
                           signatures::kIsReportedLastEra,
                           signatures::kReportRelay}) {
      if (not abi.hasFunction(signature)) {
        SL_ERROR(logger, "Contract ABI has no function {}", signature);
        complete = false;
      }
    }
    if (not complete) {
      return ContractError::MISSING_FUNCTION;
    }
    return outcome::success();
  }

  OracleContractImpl::OracleContractImpl(std::shared_ptr<EthereumApi> api,
                                         primitives::EvmAddress address,
                                         primitives::EvmAddress oracle_account,
                                         bool has_coordinator)
      : api_{std::move(api)},
        address_{address},
        oracle_account_{oracle_account},
        has_coordinator_{has_coordinator},
        log_{log::createLogger("OracleContract", "oracle_contract")} {
    BOOST_ASSERT(api_ != nullptr);
  }

  const primitives::EvmAddress &OracleContractImpl::address() const {
    return address_;
  }

  outcome::result<void> OracleContractImpl::verify() {
    OUTCOME_TRY(code, api_->getCode(address_));
    if (code.size() < kMinCodeSize) {
      SL_ERROR(log_, "No contract code at {}", address_);
      return ContractError::NO_CONTRACT_CODE;
    }
    SL_DEBUG(log_, "Contract {} has {} bytes of code", address_, code.size());
    return outcome::success();
  }

  outcome::result<std::vector<primitives::AccountId>>
  OracleContractImpl::getStashAccounts() {
    auto data = callData(selectors::kGetStashAccounts, std::string{});
    OUTCOME_TRY(result, api_->call(oracle_account_, address_, data));
    return decodeResult<std::vector<primitives::AccountId>>(
        log_,
        "getStashAccounts",
        result,
        [](ethutils::AbiDecoder &dec)
            -> outcome::result<std::vector<primitives::AccountId>> {
          size_t count = 0;
          auto items = dec.ReadArray(count);
          std::vector<primitives::AccountId> stashes;
          stashes.reserve(count);
          for (size_t i = 0; i < count; ++i) {
            OUTCOME_TRY(stash,
                        primitives::AccountId::fromHexWithPrefix(
                            items.ReadBytes(kWordSize)));
            stashes.push_back(stash);
          }
          return stashes;
        });
  }

  outcome::result<ReportedEra> OracleContractImpl::isReportedLastEra(
      const primitives::AccountId &stash) {
    ethutils::AbiEncoder args{2};
    args.WriteWord(addressWord(oracle_account_));
    args.WriteWord(stash.toHexWithPrefix());
    auto data = callData(selectors::kIsReportedLastEra, args.Finalise());
    OUTCOME_TRY(result, api_->call(oracle_account_, address_, data));
    return decodeResult<ReportedEra>(
        log_,
        "isReportedLastEra",
        result,
        [](ethutils::AbiDecoder &dec) -> outcome::result<ReportedEra> {
          OUTCOME_TRY(era, readEra(dec));
          OUTCOME_TRY(flag, common::unhexNumber<uint8_t>(dec.ReadUint(8)));
          if (flag > 1) {
            return ContractError::MALFORMED_RESULT;
          }
          return ReportedEra{era, flag == 1};
        });
  }

  bool OracleContractImpl::hasCoordinator() const {
    return has_coordinator_;
  }

  outcome::result<primitives::EraIndex> OracleContractImpl::coordinatorEra() {
    if (not has_coordinator_) {
      return ContractError::NO_COORDINATOR;
    }
    auto data = callData(selectors::kEraId, std::string{});
    OUTCOME_TRY(result, api_->call(oracle_account_, address_, data));
    return decodeResult<primitives::EraIndex>(
        log_, "eraId", result, [](ethutils::AbiDecoder &dec) {
          return readEra(dec);
        });
  }

  common::Buffer OracleContractImpl::encodeReport(
      primitives::EraIndex era,
      const primitives::StakingSnapshot &snapshot) const {
    // unbonded stash is reported with itself as controller
    const auto &controller = snapshot.controller.value_or(snapshot.stash);

    // claimedRewards is empty and goes first to the tail, unlocking chunks
    // are (value, era) tuples and follow it
    constexpr size_t kClaimedRewardsSize = kWordSize;
    ethutils::AbiEncoder ledger{kLedgerHeadWords};
    ledger.WriteWord(snapshot.stash.toHexWithPrefix());
    ledger.WriteWord(controller.toHexWithPrefix());
    ledger.WriteWord(uintWord(static_cast<uint64_t>(snapshot.status)));
    ledger.WriteWord(balanceWord(snapshot.active_balance));
    ledger.WriteWord(balanceWord(snapshot.total_balance));
    ledger.WriteWord(
        uintWord(kLedgerHeadWords * kWordSize + kClaimedRewardsSize));
    ledger.WriteArray(std::vector<std::string>{});
    ledger.WriteWord(balanceWord(snapshot.free_balance));
    ledger.WriteWord(uintWord(static_cast<uint64_t>(snapshot.slashing_spans)));

    auto tuple = withoutPrefix(ledger.Finalise());
    tuple += withoutPrefix(uintWord(snapshot.unlocking.size()));
    for (auto &chunk : snapshot.unlocking) {
      tuple += withoutPrefix(balanceWord(chunk.value));
      tuple += withoutPrefix(uintWord(static_cast<uint64_t>(chunk.era)));
    }

    // the report tuple is dynamic, its head slot keeps the offset
    ethutils::AbiEncoder args{2};
    args.WriteWord(uintWord(static_cast<uint64_t>(era)));
    args.WriteWord(uintWord(2 * kWordSize));
    return callData(selectors::kReportRelay, args.Finalise() + tuple);
  }

}  // namespace eraoracle::parachain
