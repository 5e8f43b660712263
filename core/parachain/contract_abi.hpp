/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

#include "outcome/outcome.hpp"

namespace eraoracle::parachain {

  enum class ContractAbiError {
    FILE_NOT_READABLE = 1,
    MALFORMED_JSON,
    MALFORMED_ENTRY,
  };

  /**
   * Function signatures declared by a contract json ABI, in canonical form
   * used for selector computation, e.g. `transfer(address,uint256)`
   */
  class ContractAbi {
   public:
    static outcome::result<ContractAbi> load(const std::filesystem::path &path);

    static outcome::result<ContractAbi> parse(std::string_view json);

    bool hasFunction(std::string_view signature) const;

    const std::set<std::string, std::less<>> &functions() const {
      return functions_;
    }

   private:
    std::set<std::string, std::less<>> functions_;
  };

}  // namespace eraoracle::parachain

OUTCOME_HPP_DECLARE_ERROR(eraoracle::parachain, ContractAbiError);
