/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(pc::common, UnhexError, e) {
  using pc::common::UnhexError;
  switch (e) {
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
    case UnhexError::kMissingPrefix:
      return "Input must start with 0x";
  }
  return "Unknown error";
}

namespace pc::common {
  std::string hex_lower(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), back_inserter(res));
    return res;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    Bytes blob;
    blob.reserve((hex.size() + 1) / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::kNotEnoughInput;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::kNonHexInput;
    }
  }

  outcome::result<Bytes> unhexWith0x(std::string_view hex) {
    constexpr std::string_view kPrefix{"0x"};
    if (hex.substr(0, kPrefix.size()) != kPrefix) {
      return UnhexError::kMissingPrefix;
    }
    return unhex(hex.substr(kPrefix.size()));
  }
}  // namespace pc::common
