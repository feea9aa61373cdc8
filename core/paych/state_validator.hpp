/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "paych/signature_verifier.hpp"
#include "paych/state_digest.hpp"

namespace pc::paych {

  /**
   * Which agent signatures a state update must carry
   */
  struct SignatureRequirement {
    bool require_a{true};
    bool require_b{true};

    static constexpr SignatureRequirement bilateral() {
      return {true, true};
    }
  };

  /**
   * Decides whether a signed state update may replace the channel state.
   * Nonce freshness is checked by the caller.
   */
  class StateValidator {
   public:
    StateValidator(std::shared_ptr<StateDigest> digest,
                   std::shared_ptr<SignatureVerifier> verifier);

    /**
     * Checks in order: balances add up to the total deposit
     * (kBalanceMismatch), channel is Joined or in Challenge
     * (kInvalidStatus), each required signature belongs to its agent
     * (kInvalidSignature)
     * @param channel - current channel record
     * @param signed_state - proposed update with agent signatures
     * @param requirement - signatures to check, both for balance changes
     */
    outcome::result<void> validate(
        const Channel &channel,
        const SignedState &signed_state,
        SignatureRequirement requirement =
            SignatureRequirement::bilateral()) const;

   private:
    outcome::result<bool> verifyAgent(const Hash256 &digest,
                                      const Signature &signature,
                                      const Address &agent) const;

    std::shared_ptr<StateDigest> digest_;
    std::shared_ptr<SignatureVerifier> verifier_;
  };
}  // namespace pc::paych
