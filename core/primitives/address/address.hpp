/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/blob.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace pc::primitives::address {
  using crypto::secp256k1::PublicKey;

  /**
   * @brief Potential errors creating addresses
   */
  enum class AddressError {
    kInvalidPayload = 1, /**< Not a 0x-prefixed 20-byte hex string */
    kInvalidPublicKey,   /**< Public key is not in uncompressed form */
  };

  /**
   * @brief 20-byte account identity: the last 20 bytes of keccak256 of an
   * uncompressed secp256k1 public key (without the 0x04 tag). Also used for
   * asset identifiers. The all-zero address is the null identity.
   */
  struct Address : public common::Blob<20> {
    using Blob::Blob;

    Address() = default;

    explicit Address(const common::Blob<20> &blob) : Blob{blob} {}

    /**
     * @brief Derives address of the key holder
     * @param public_key - uncompressed public key, 65 bytes starting with 0x04
     */
    static outcome::result<Address> makeSecp256k1(const PublicKey &public_key);

    /**
     * @brief Parses "0x"-prefixed hex string, case insensitive
     */
    static outcome::result<Address> fromString(std::string_view str);

    /**
     * @return lowercase "0x"-prefixed hex string
     */
    std::string toString() const;

    bool isNull() const {
      return isZero();
    }
  };
}  // namespace pc::primitives::address

template <>
struct std::hash<pc::primitives::address::Address>
    : std::hash<pc::common::Blob<20>> {};

/**
 * @brief Outcome errors declaration
 */
OUTCOME_HPP_DECLARE_ERROR(pc::primitives::address, AddressError);
