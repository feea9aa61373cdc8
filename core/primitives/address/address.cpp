/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include "crypto/keccak/keccak.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pc::primitives::address, AddressError, e) {
  using pc::primitives::address::AddressError;
  switch (e) {
    case (AddressError::kInvalidPayload):
      return "Failed to create address: expected 0x-prefixed 20-byte hex";
    case (AddressError::kInvalidPublicKey):
      return "Failed to create address: public key must be uncompressed";
  }
  return "Failed to create address: unknown error";
}

namespace pc::primitives::address {
  using crypto::keccak::keccak256;

  constexpr uint8_t kUncompressedTag{0x04};

  outcome::result<Address> Address::makeSecp256k1(const PublicKey &public_key) {
    if (public_key[0] != kUncompressedTag) {
      return AddressError::kInvalidPublicKey;
    }
    const auto hash = keccak256(BytesIn{public_key}.subspan(1));
    Address address;
    std::copy(hash.end() - kSize, hash.end(), address.begin());
    return address;
  }

  outcome::result<Address> Address::fromString(std::string_view str) {
    auto bytes = common::unhexWith0x(str);
    if (!bytes || bytes.value().size() != kSize) {
      return AddressError::kInvalidPayload;
    }
    return Address{Blob<20>::fromSpan(bytes.value()).value()};
  }

  std::string Address::toString() const {
    return "0x" + toHex();
  }
}  // namespace pc::primitives::address
