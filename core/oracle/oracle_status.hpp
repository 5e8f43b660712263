/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "primitives/common.hpp"

namespace eraoracle::oracle {

  enum class EngineState {
    Starting,
    Monitoring,
    Processing,
    Recovering,
  };

  std::string_view toString(EngineState state);

  /**
   * Operational values of the oracle, emitted to log
   */
  struct OracleStatus {
    EngineState state = EngineState::Starting;
    std::optional<primitives::EraIndex> active_era;
    std::optional<primitives::EraIndex> last_reported_era;
    std::optional<primitives::BlockNumber> last_boundary;
    std::optional<std::string> relay_url;
    uint32_t relay_failures = 0;
    std::optional<std::string> para_url;
    uint32_t para_failures = 0;
    std::chrono::milliseconds watchdog_accumulated{0};
    /// free balance of stashes reported in the last processed era
    primitives::Balance total_free_balance{0};
    uint64_t tx_success = 0;
    uint64_t tx_reverted = 0;
    uint64_t tx_likely_failing = 0;
  };

}  // namespace eraoracle::oracle

template <>
struct fmt::formatter<eraoracle::oracle::EngineState>
    : fmt::formatter<std::string_view> {
  auto format(eraoracle::oracle::EngineState state,
              format_context &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        eraoracle::oracle::toString(state), ctx);
  }
};
