/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace pc::common {
  enum class UnhexError {
    kNonHexInput = 1,
    kNotEnoughInput,
    kMissingPrefix,
  };

  /**
   * @brief Converts bytes to lowercase hex representation, without prefix
   * @param bytes data to convert
   * @return hex string
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex string to bytes
   * @param hex string of even length, upper or lower case
   * @return decoded bytes or error
   */
  outcome::result<Bytes> unhex(std::string_view hex);

  /**
   * @brief Same as unhex, but the input must start with "0x"
   */
  outcome::result<Bytes> unhexWith0x(std::string_view hex);
}  // namespace pc::common

OUTCOME_HPP_DECLARE_ERROR(pc::common, UnhexError);
