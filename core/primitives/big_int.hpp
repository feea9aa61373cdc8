/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <boost/multiprecision/cpp_int.hpp>

#include "common/bytes.hpp"

namespace pc::primitives {
  using BigInt = boost::multiprecision::cpp_int;

  /**
   * Encodes non-negative integer as 32-byte big-endian word, the way uint256
   * is laid out in abi-encoded data
   * @param value - integer in range [0, 2^256)
   * @return false if value does not fit
   */
  inline bool encodeUint256(const BigInt &value, BytesOut out) {
    static const BigInt kLimit{BigInt{1} << 256};
    if (value < 0 || value >= kLimit || out.size() != 32) {
      return false;
    }
    std::fill(out.begin(), out.end(), 0);
    if (value == 0) {
      return true;
    }
    Bytes be;
    export_bits(value, std::back_inserter(be), 8);
    std::copy(be.begin(), be.end(), out.end() - be.size());
    return true;
  }
}  // namespace pc::primitives
