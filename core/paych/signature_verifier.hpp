/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "paych/channel.hpp"

namespace pc::paych {

  /**
   * Checks that a signature over a digest was made by the claimed signer
   */
  class SignatureVerifier {
   public:
    virtual ~SignatureVerifier() = default;

    /**
     * @param digest - 32-byte structured-data digest
     * @param signature - 65-byte signature
     * @param signer - claimed signer address
     * @return true if signature was made by signer over digest, false for
     * any other signature, malformed ones included
     */
    virtual outcome::result<bool> verify(const Hash256 &digest,
                                         const Signature &signature,
                                         const Address &signer) const = 0;
  };
}  // namespace pc::paych
