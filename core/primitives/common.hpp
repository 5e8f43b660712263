/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <fmt/format.h>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/operators.hpp>

#include "common/blob.hpp"

ERAORACLE_BLOB_STRICT_TYPEDEF(eraoracle::primitives, BlockHash, 32);
ERAORACLE_BLOB_STRICT_TYPEDEF(eraoracle::primitives, AccountId, 32);
ERAORACLE_BLOB_STRICT_TYPEDEF(eraoracle::primitives, EvmAddress, 20);

namespace eraoracle::primitives {
  using BlockNumber = uint32_t;
  using EraIndex = uint32_t;
  using Balance = boost::multiprecision::uint128_t;

  /// Relay chain block identified by both number and hash
  struct BlockInfo : public boost::equality_comparable<BlockInfo> {
    BlockInfo() = default;

    BlockInfo(BlockNumber n, const BlockHash &h) : number(n), hash(h) {}

    BlockNumber number{};
    BlockHash hash{};

    bool operator==(const BlockInfo &o) const {
      return number == o.number and hash == o.hash;
    }
  };

}  // namespace eraoracle::primitives

template <>
struct fmt::formatter<eraoracle::primitives::BlockInfo> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const eraoracle::primitives::BlockInfo &block_info,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(), "#{} ({:s})", block_info.number, block_info.hash);
  }
};

template <>
struct fmt::formatter<eraoracle::primitives::Balance>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const eraoracle::primitives::Balance &balance,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(balance.str(), ctx);
  }
};
