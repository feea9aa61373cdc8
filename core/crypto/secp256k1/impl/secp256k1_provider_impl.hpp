/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/secp256k1/secp256k1_provider.hpp"

namespace pc::crypto::secp256k1 {

  /**
   * Implemetation of Secp256k1 provider with
   * - public key in uncompressed form
   * - signature in compact recoverable form
   * - NO digest function
   */
  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    Secp256k1ProviderImpl();

    outcome::result<KeyPair> generate() const override;

    outcome::result<PublicKey> derive(const PrivateKey &key) const override;

    outcome::result<Signature> sign(const MessageHash &digest,
                                    const PrivateKey &key) const override;

    outcome::result<PublicKey> recoverPublicKey(
        const MessageHash &digest, const Signature &signature) const override;

   private:
    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;

    static outcome::result<int> recoveryId(const Signature &signature);
  };

}  // namespace pc::crypto::secp256k1
