/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/state_digest.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pc::paych, StateDigestError, e) {
  using E = pc::paych::StateDigestError;
  switch (e) {
    case E::kValueOutOfRange:
      return "StateDigest: value is negative or does not fit uint256";
  }
  return "StateDigest: unknown error";
}
