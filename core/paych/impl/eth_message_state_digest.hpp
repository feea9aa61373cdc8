/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "paych/state_digest.hpp"

namespace pc::paych {
  /**
   * Legacy personal_sign wrapping:
   * keccak256("\x19Ethereum Signed Message:\n32" || keccak256(channelId ||
   * nonce || balanceA || balanceB)), integers as 32-byte words
   */
  class EthMessageStateDigest : public StateDigest {
   public:
    outcome::result<Hash256> fingerprint(const StateUpdate &state) const;

    outcome::result<Hash256> digest(const StateUpdate &state) const override;
  };
}  // namespace pc::paych
