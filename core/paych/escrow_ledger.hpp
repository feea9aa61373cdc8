/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "paych/channel.hpp"

namespace pc::paych {

  /**
   * Value custody holding channel deposits until settlement. Each call is
   * all-or-nothing: on error no funds have moved.
   */
  class EscrowLedger {
   public:
    virtual ~EscrowLedger() = default;

    /**
     * Moves funds from payer account into escrow custody
     * @param payer - account to debit
     * @param asset - token
     * @param amount - non-negative amount
     */
    virtual outcome::result<void> transferIn(const Address &payer,
                                             const AssetId &asset,
                                             const TokenAmount &amount) = 0;

    /**
     * Moves funds from escrow custody to payee account
     * @param payee - account to credit
     * @param asset - token
     * @param amount - non-negative amount
     */
    virtual outcome::result<void> transferOut(const Address &payee,
                                              const AssetId &asset,
                                              const TokenAmount &amount) = 0;
  };
}  // namespace pc::paych
