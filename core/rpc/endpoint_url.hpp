/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "common/uri.hpp"
#include "log/logger.hpp"
#include "rpc/rpc_error.hpp"

namespace eraoracle::rpc {

  /**
   * Accepts ws:// and wss:// urls with a valid host and no fragment
   */
  outcome::result<common::Uri> parseEndpointUrl(std::string_view url);

  /**
   * @return urls acceptable by parseEndpointUrl, order is kept; every rejected
   * url is logged with a reason
   */
  std::vector<std::string> filterEndpointUrls(
      const std::vector<std::string> &urls, const log::Logger &logger);

}  // namespace eraoracle::rpc
