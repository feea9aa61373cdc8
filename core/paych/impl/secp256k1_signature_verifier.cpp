/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/impl/secp256k1_signature_verifier.hpp"

#include "common/logger.hpp"

namespace pc::paych {
  Secp256k1SignatureVerifier::Secp256k1SignatureVerifier(
      std::shared_ptr<Secp256k1Provider> secp256k1)
      : secp256k1_{std::move(secp256k1)} {}

  outcome::result<bool> Secp256k1SignatureVerifier::verify(
      const Hash256 &digest,
      const Signature &signature,
      const Address &signer) const {
    static common::Logger logger = common::createLogger("paych");
    if (signer.isNull()) {
      return false;
    }
    auto public_key = secp256k1_->recoverPublicKey(digest, signature);
    if (!public_key) {
      logger->debug("signature for {} not recoverable: {}",
                    signer.toString(),
                    public_key.error().message());
      return false;
    }
    OUTCOME_TRY(recovered, Address::makeSecp256k1(public_key.value()));
    return recovered == signer;
  }
}  // namespace pc::paych
