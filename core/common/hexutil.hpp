/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace eraoracle::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    VALUE_OUT_OF_RANGE,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace eraoracle::common

OUTCOME_HPP_DECLARE_ERROR(eraoracle::common, UnhexError);

namespace eraoracle::common {

  /**
   * @brief Converts bytes to hex representation
   * @param bytes input bytes
   * @return lowercase hexstring
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes input bytes
   * @return lowercase hexstring
   */
  std::string hex_lower_0x(BufferView bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex hexstring, both uppercase and lowercase digits are accepted
   * @return bytes if input string is hex encoded and has even length
   */
  outcome::result<Buffer> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   */
  outcome::result<Buffer> unhexWith0x(std::string_view hex);

  /**
   * @brief Unhex a big-endian quantity as returned by ethereum json-rpc
   * ("0x1a", "0x0"). Odd number of digits is allowed.
   * @tparam T unsigned integer value type to decode
   */
  template <class T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
  outcome::result<T> unhexNumber(std::string_view value) {
    constexpr std::string_view prefix = "0x";
    if (not value.starts_with(prefix)) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    value.remove_prefix(prefix.size());
    if (value.empty()) {
      return UnhexError::NOT_ENOUGH_INPUT;
    }
    while (value.size() > 1 and value.front() == '0') {
      value.remove_prefix(1);
    }
    if (value.size() > sizeof(T) * 2) {
      return UnhexError::VALUE_OUT_OF_RANGE;
    }

    T result{0u};
    for (auto ch : value) {
      uint8_t digit = 0;
      if (ch >= '0' and ch <= '9') {
        digit = ch - '0';
      } else if (ch >= 'a' and ch <= 'f') {
        digit = ch - 'a' + 10;
      } else if (ch >= 'A' and ch <= 'F') {
        digit = ch - 'A' + 10;
      } else {
        return UnhexError::NON_HEX_INPUT;
      }
      if constexpr (sizeof(T) > 1) {
        result <<= 4u;
      } else {
        result = static_cast<T>(result << 4u);
      }
      result += digit;
    }
    return result;
  }

  /**
   * @brief Encodes a quantity the way ethereum json-rpc expects it: 0x prefix
   * and no leading zeros
   */
  template <class T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
  std::string hexNumber(T value) {
    static constexpr char digits[] = "0123456789abcdef";
    if (value == 0) {
      return "0x0";
    }
    std::string reversed;
    while (value != 0) {
      reversed.push_back(digits[static_cast<uint8_t>(value & 0xfu)]);
      value >>= 4u;
    }
    return "0x" + std::string(reversed.rbegin(), reversed.rend());
  }

}  // namespace eraoracle::common
