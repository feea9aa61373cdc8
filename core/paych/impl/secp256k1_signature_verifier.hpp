/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "paych/signature_verifier.hpp"

namespace pc::paych {
  using crypto::secp256k1::Secp256k1Provider;

  /**
   * Recovers signer public key from the signature and compares its address
   * with the claimed one
   */
  class Secp256k1SignatureVerifier : public SignatureVerifier {
   public:
    explicit Secp256k1SignatureVerifier(
        std::shared_ptr<Secp256k1Provider> secp256k1);

    outcome::result<bool> verify(const Hash256 &digest,
                                 const Signature &signature,
                                 const Address &signer) const override;

   private:
    std::shared_ptr<Secp256k1Provider> secp256k1_;
  };
}  // namespace pc::paych
