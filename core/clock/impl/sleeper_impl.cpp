/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/sleeper_impl.hpp"

#include <thread>

namespace eraoracle::clock {

  bool SleeperImpl::sleepFor(Duration duration) {
    auto token = stop_source_.get_token();
    std::unique_lock lock{mutex_};
    // returns true only if predicate (stop requested) became true
    return not cv_.wait_for(
        lock, token, duration, [&token] { return token.stop_requested(); });
  }

  void SleeperImpl::pause(Duration duration) {
    std::this_thread::sleep_for(duration);
  }

  bool SleeperImpl::stopRequested() const {
    return stop_source_.stop_requested();
  }

  void SleeperImpl::requestStop() {
    stop_source_.request_stop();
  }

}  // namespace eraoracle::clock
