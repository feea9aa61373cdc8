/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/state_signer.hpp"

namespace pc::paych {
  constexpr uint8_t kEthRecoveryOffset{27};

  StateSigner::StateSigner(std::shared_ptr<StateDigest> digest,
                           std::shared_ptr<Secp256k1Provider> secp256k1)
      : digest_{std::move(digest)}, secp256k1_{std::move(secp256k1)} {}

  outcome::result<Signature> StateSigner::sign(const StateUpdate &state,
                                               const PrivateKey &key) const {
    OUTCOME_TRY(hash, digest_->digest(state));
    OUTCOME_TRY(signature, secp256k1_->sign(hash, key));
    signature[64] += kEthRecoveryOffset;
    return signature;
  }

  outcome::result<SignedState> StateSigner::signBoth(
      const StateUpdate &state,
      const PrivateKey &key_a,
      const PrivateKey &key_b) const {
    OUTCOME_TRY(signature_a, sign(state, key_a));
    OUTCOME_TRY(signature_b, sign(state, key_b));
    return SignedState{state, signature_a, signature_b};
  }
}  // namespace pc::paych
