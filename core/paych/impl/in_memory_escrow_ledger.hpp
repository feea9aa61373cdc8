/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "paych/escrow_ledger.hpp"

namespace pc::paych {
  enum class EscrowLedgerError {
    kInsufficientFunds = 1,
    kInsufficientCustody,
    kNegativeAmount,
  };

  /**
   * Escrow ledger kept in process memory: per-asset account balances plus
   * the amount held in custody
   */
  class InMemoryEscrowLedger : public EscrowLedger {
   public:
    outcome::result<void> transferIn(const Address &payer,
                                     const AssetId &asset,
                                     const TokenAmount &amount) override;

    outcome::result<void> transferOut(const Address &payee,
                                      const AssetId &asset,
                                      const TokenAmount &amount) override;

    /**
     * Mints funds to account, used to fund agents
     */
    outcome::result<void> credit(const Address &account,
                                 const AssetId &asset,
                                 const TokenAmount &amount);

    TokenAmount balanceOf(const Address &account, const AssetId &asset) const;

    TokenAmount custodyOf(const AssetId &asset) const;

   private:
    using AccountKey = std::pair<AssetId, Address>;

    std::map<AccountKey, TokenAmount> accounts_;
    std::map<AssetId, TokenAmount> custody_;
    mutable std::mutex mutex_;
  };
}  // namespace pc::paych

OUTCOME_HPP_DECLARE_ERROR(pc::paych, EscrowLedgerError);
