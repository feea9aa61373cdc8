/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_PAYCHAN_TEST_TESTUTIL_LITERALS_HPP
#define CPP_PAYCHAN_TEST_TESTUTIL_LITERALS_HPP

#include "common/blob.hpp"
#include "common/hexutil.hpp"
#include "primitives/address/address.hpp"

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  return pc::common::unhex(std::string_view(c, s)).value();
}

inline pc::common::Hash256 operator""_hash256(const char *c, size_t s) {
  return pc::common::Hash256::fromHex(std::string_view(c, s)).value();
}

inline pc::common::Blob<32> operator""_blob32(const char *c, size_t s) {
  return pc::common::Blob<32>::fromHex(std::string_view(c, s)).value();
}

inline pc::common::Blob<65> operator""_blob65(const char *c, size_t s) {
  return pc::common::Blob<65>::fromHex(std::string_view(c, s)).value();
}

inline pc::primitives::address::Address operator""_address(const char *c,
                                                           size_t s) {
  return pc::primitives::address::Address::fromString(std::string_view(c, s))
      .value();
}

#endif  // CPP_PAYCHAN_TEST_TESTUTIL_LITERALS_HPP
