/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "paych/channel.hpp"

namespace pc::paych {
  enum class StateDigestError { kValueOutOfRange = 1 };

  /**
   * Builds the digest agents sign for a state update. On-chain verification
   * and the off-chain signer must use the same wrapping, otherwise every
   * signature is rejected.
   */
  class StateDigest {
   public:
    virtual ~StateDigest() = default;

    /**
     * @param state - update to fingerprint
     * @return 32-byte digest or kValueOutOfRange if a balance is negative or
     * does not fit uint256
     */
    virtual outcome::result<Hash256> digest(const StateUpdate &state) const = 0;
  };
}  // namespace pc::paych

OUTCOME_HPP_DECLARE_ERROR(pc::paych, StateDigestError);
