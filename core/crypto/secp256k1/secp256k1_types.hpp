/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace pc::crypto::secp256k1 {

  static const size_t kPrivateKeyLength = 32;
  static const size_t kPublicKeyUncompressedLength = 65;
  static const size_t kMessageHashLength = 32;
  static const size_t kSignatureLength = 65;

  /**
   * @brief Common types
   */
  using PrivateKey = common::Blob<kPrivateKeyLength>;
  using PublicKey = common::Blob<kPublicKeyUncompressedLength>;
  using MessageHash = common::Hash256;
  /**
   * Compact ECDSA signature r || s || v, 65 bytes. The recovery id v is
   * stored either raw (0, 1) or with Ethereum offset (27, 28)
   */
  using Signature = common::Blob<kSignatureLength>;

  /**
   * @struct Key pair
   */
  struct KeyPair {
    PrivateKey private_key; /**< Secp256k1 private key */
    PublicKey public_key;   /**< Secp256k1 public uncompressed key */

    bool operator==(const KeyPair &other) const {
      return private_key == other.private_key && public_key == other.public_key;
    }
  };
}  // namespace pc::crypto::secp256k1
