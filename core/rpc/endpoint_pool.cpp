/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/endpoint_pool.hpp"

#include <boost/assert.hpp>

#include "rpc/endpoint_url.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::rpc, EndpointPoolError, e) {
  using E = eraoracle::rpc::EndpointPoolError;
  switch (e) {
    case E::STOPPED:
      return "Endpoint selection was interrupted by stop request";
    case E::NO_URLS:
      return "Endpoint pool has no urls";
  }
  return "Unknown EndpointPoolError";
}

namespace eraoracle::rpc {

  EndpointPool::EndpointPool(std::string name,
                             Config config,
                             std::shared_ptr<Connector> connector,
                             std::shared_ptr<clock::Sleeper> sleeper)
      : name_{std::move(name)},
        config_{std::move(config)},
        connector_{std::move(connector)},
        sleeper_{std::move(sleeper)},
        log_{log::createLogger("EndpointPool", "endpoint_pool")} {
    BOOST_ASSERT(connector_ != nullptr);
    BOOST_ASSERT(sleeper_ != nullptr);
  }

  std::shared_ptr<RpcConnection> EndpointPool::tryConnect(
      const std::string &url) {
    if (auto res = parseEndpointUrl(url); res.has_error()) {
      SL_WARN(log_,
              "{}: unsupported endpoint {}: {}",
              name_,
              url,
              res.error().message());
      return nullptr;
    }
    auto res = connector_->connect(url);
    if (res.has_error()) {
      SL_WARN(log_,
              "{}: failed to connect to {}: {}",
              name_,
              url,
              res.error().message());
      return nullptr;
    }
    SL_INFO(log_, "{}: the connection was made at {}", name_, url);
    {
      std::lock_guard lock{mutex_};
      current_ = url;
    }
    return std::move(res.value());
  }

  outcome::result<std::shared_ptr<RpcConnection>> EndpointPool::select(
      const std::set<std::string> &undesirable) {
    if (config_.urls.empty()) {
      return EndpointPoolError::NO_URLS;
    }

    // No upper bound on attempts, only stop request interrupts the loop
    while (not sleeper_->stopRequested()) {
      std::vector<std::string> skipped;
      for (auto &url : config_.urls) {
        if (undesirable.contains(url)) {
          SL_INFO(log_, "{}: skipping undesirable url {}", name_, url);
          skipped.push_back(url);
          continue;
        }
        if (auto connection = tryConnect(url)) {
          return connection;
        }
        if (sleeper_->stopRequested()) {
          return EndpointPoolError::STOPPED;
        }
      }

      // every candidate failed, so exclusion is lifted to avoid a deadlock
      for (auto &url : skipped) {
        if (auto connection = tryConnect(url)) {
          return connection;
        }
        if (sleeper_->stopRequested()) {
          return EndpointPoolError::STOPPED;
        }
      }

      SL_ERROR(log_,
               "{}: failed to connect to any node, retry in {} ms",
               name_,
               config_.retry_timeout.count());
      if (not sleeper_->sleepFor(config_.retry_timeout)) {
        break;
      }
    }
    return EndpointPoolError::STOPPED;
  }

  outcome::result<std::shared_ptr<RpcConnection>> EndpointPool::rotate() {
    auto avoided = undesirable();
    {
      std::lock_guard lock{mutex_};
      for (auto &url : avoided) {
        failures_.erase(url);
      }
    }
    return select(avoided);
  }

  void EndpointPool::recordFailure(const std::string &url) {
    std::lock_guard lock{mutex_};
    auto counter = ++failures_[url];
    SL_DEBUG(log_, "{}: failure #{} of {}", name_, counter, url);
  }

  void EndpointPool::recordSuccess(const std::string &url) {
    std::lock_guard lock{mutex_};
    failures_.erase(url);
  }

  uint32_t EndpointPool::failures(const std::string &url) const {
    std::lock_guard lock{mutex_};
    if (auto it = failures_.find(url); it != failures_.end()) {
      return it->second;
    }
    return 0;
  }

  uint32_t EndpointPool::totalFailures() const {
    std::lock_guard lock{mutex_};
    uint32_t total = 0;
    for (auto &[url, counter] : failures_) {
      total += counter;
    }
    return total;
  }

  std::set<std::string> EndpointPool::undesirable() const {
    std::lock_guard lock{mutex_};
    std::set<std::string> result;
    for (auto &[url, counter] : failures_) {
      if (counter >= config_.max_failures) {
        result.insert(url);
      }
    }
    return result;
  }

  void EndpointPool::resetFailures() {
    std::lock_guard lock{mutex_};
    failures_.clear();
  }

  std::optional<std::string> EndpointPool::current() const {
    std::lock_guard lock{mutex_};
    return current_;
  }

}  // namespace eraoracle::rpc
