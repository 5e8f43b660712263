/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <scale/scale.hpp>

#include "primitives/common.hpp"

namespace eraoracle::primitives {

  namespace detail {
    /// Fixed width little-endian u128, as used by balances pallet
    inline Balance decodeU128(scale::ScaleDecoderStream &s) {
      Balance value{0};
      for (size_t i = 0; i < 16; ++i) {
        uint8_t byte = 0;
        s >> byte;
        value |= Balance(byte) << (8 * i);
      }
      return value;
    }

    template <typename T>
    T decodeCompact(scale::ScaleDecoderStream &s) {
      scale::CompactInteger value;
      s >> value;
      return value.convert_to<T>();
    }
  }  // namespace detail

  /// Staking::ActiveEra value
  struct ActiveEraInfo {
    EraIndex index{};
    /// Moment of era start in milliseconds, unset until the first block of era
    std::optional<uint64_t> start;

    friend scale::ScaleDecoderStream &operator>>(scale::ScaleDecoderStream &s,
                                                 ActiveEraInfo &v) {
      return s >> v.index >> v.start;
    }
  };

  struct UnlockChunk {
    Balance value{};
    EraIndex era{};

    bool operator==(const UnlockChunk &other) const = default;

    friend scale::ScaleDecoderStream &operator>>(scale::ScaleDecoderStream &s,
                                                 UnlockChunk &v) {
      v.value = detail::decodeCompact<Balance>(s);
      v.era = detail::decodeCompact<EraIndex>(s);
      return s;
    }
  };

  /// Staking::Ledger value, keyed by controller
  struct StakingLedger {
    AccountId stash;
    Balance total{};
    Balance active{};
    std::vector<UnlockChunk> unlocking;
    std::vector<EraIndex> claimed_rewards;

    friend scale::ScaleDecoderStream &operator>>(scale::ScaleDecoderStream &s,
                                                 StakingLedger &v) {
      s >> v.stash;
      v.total = detail::decodeCompact<Balance>(s);
      v.active = detail::decodeCompact<Balance>(s);
      return s >> v.unlocking >> v.claimed_rewards;
    }
  };

  /// Prefix of System::Account value; trailing balance fields are skipped
  struct AccountInfo {
    uint32_t nonce{};
    uint32_t consumers{};
    uint32_t providers{};
    uint32_t sufficients{};
    Balance free{};

    friend scale::ScaleDecoderStream &operator>>(scale::ScaleDecoderStream &s,
                                                 AccountInfo &v) {
      s >> v.nonce >> v.consumers >> v.providers >> v.sufficients;
      v.free = detail::decodeU128(s);
      return s;
    }
  };

  /// Staking::SlashingSpans value
  struct SlashingSpans {
    uint32_t span_index{};
    EraIndex last_start{};
    EraIndex last_nonzero_slash{};
    std::vector<EraIndex> prior;

    friend scale::ScaleDecoderStream &operator>>(scale::ScaleDecoderStream &s,
                                                 SlashingSpans &v) {
      return s >> v.span_index >> v.last_start >> v.last_nonzero_slash
          >> v.prior;
    }
  };

  /// Numeric values are a part of the contract interface
  enum class StakeStatus : uint8_t {
    Idle = 0,
    Nominator = 1,
    Validator = 2,
    None = 3,
  };

  std::string_view toString(StakeStatus status);

  /// Staking position of a stash read at one fixed block
  struct StakingSnapshot {
    AccountId stash;
    /// Controller account, unset when the stash is not bonded
    std::optional<AccountId> controller;
    StakeStatus status{StakeStatus::None};
    Balance active_balance{};
    Balance total_balance{};
    std::vector<UnlockChunk> unlocking;
    Balance free_balance{};
    uint32_t slashing_spans{};

    bool operator==(const StakingSnapshot &other) const = default;
  };

}  // namespace eraoracle::primitives

template <>
struct fmt::formatter<eraoracle::primitives::StakeStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(eraoracle::primitives::StakeStatus status,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        eraoracle::primitives::toString(status), ctx);
  }
};
