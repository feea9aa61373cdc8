/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "paych/state_digest.hpp"

namespace pc::paych {
  using crypto::secp256k1::PrivateKey;
  using crypto::secp256k1::Secp256k1Provider;

  /**
   * Off-chain side of a state update: signs the digest of a balance split
   * with an agent key
   */
  class StateSigner {
   public:
    StateSigner(std::shared_ptr<StateDigest> digest,
                std::shared_ptr<Secp256k1Provider> secp256k1);

    /**
     * @return 65-byte signature, recovery id with Ethereum offset (27, 28)
     */
    outcome::result<Signature> sign(const StateUpdate &state,
                                    const PrivateKey &key) const;

    /**
     * Signs the update with both agent keys
     */
    outcome::result<SignedState> signBoth(const StateUpdate &state,
                                          const PrivateKey &key_a,
                                          const PrivateKey &key_b) const;

   private:
    std::shared_ptr<StateDigest> digest_;
    std::shared_ptr<Secp256k1Provider> secp256k1_;
  };
}  // namespace pc::paych
