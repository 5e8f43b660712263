/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/endpoint_url.hpp"

namespace eraoracle::rpc {

  outcome::result<common::Uri> parseEndpointUrl(std::string_view url) {
    auto uri = common::Uri::parse(url);
    if (uri.error().has_value()) {
      return EndpointUrlError::MALFORMED_URL;
    }
    if (uri.Schema != "ws" and uri.Schema != "wss") {
      return EndpointUrlError::UNSUPPORTED_SCHEMA;
    }
    if (not uri.Fragment.empty()) {
      return EndpointUrlError::HAS_FRAGMENT;
    }
    return uri;
  }

  std::vector<std::string> filterEndpointUrls(
      const std::vector<std::string> &urls, const log::Logger &logger) {
    std::vector<std::string> valid;
    valid.reserve(urls.size());
    for (auto &url : urls) {
      if (auto res = parseEndpointUrl(url); res.has_error()) {
        SL_WARN(logger, "Url {} is skipped: {}", url, res.error().message());
        continue;
      }
      valid.push_back(url);
    }
    return valid;
  }

}  // namespace eraoracle::rpc
