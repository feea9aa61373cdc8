/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "paych/escrow_ledger.hpp"

namespace pc::paych {
  class EscrowLedgerMock : public EscrowLedger {
   public:
    MOCK_METHOD3(transferIn,
                 outcome::result<void>(const Address &,
                                       const AssetId &,
                                       const TokenAmount &));
    MOCK_METHOD3(transferOut,
                 outcome::result<void>(const Address &,
                                       const AssetId &,
                                       const TokenAmount &));
  };
}  // namespace pc::paych
