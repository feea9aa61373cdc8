/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "paych/signature_verifier.hpp"

namespace pc::paych {
  class SignatureVerifierMock : public SignatureVerifier {
   public:
    MOCK_CONST_METHOD3(verify,
                       outcome::result<bool>(const Hash256 &,
                                             const Signature &,
                                             const Address &));
  };
}  // namespace pc::paych
