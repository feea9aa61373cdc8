/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace pc::crypto::secp256k1 {

  /**
   * ECDSA over secp256k1 with recoverable signatures. Messages are 32-byte
   * digests, the provider applies no hashing of its own.
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief Generate private and public keys
     * @return Secp256k1 key pair or error code
     */
    virtual outcome::result<KeyPair> generate() const = 0;

    /**
     * @brief Generate public key from private key
     * @param key - private key for deriving public key
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> derive(const PrivateKey &key) const = 0;

    /**
     * @brief Create recoverable signature for a digest
     * @param digest - data to sign
     * @param key - private key for signing
     * @return signature with raw recovery id (0 or 1) or error code
     */
    virtual outcome::result<Signature> sign(const MessageHash &digest,
                                            const PrivateKey &key) const = 0;

    /**
     * RecoverPubkey returns the the public key of the signer.
     * @param digest - signed data
     * @param signature - signature, recovery id 0..3 or 27..30
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> recoverPublicKey(
        const MessageHash &digest, const Signature &signature) const = 0;
  };

}  // namespace pc::crypto::secp256k1
