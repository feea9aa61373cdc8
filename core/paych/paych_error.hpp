/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace pc::paych {

  /**
   * Reasons a channel transition is refused. The channel is left exactly as
   * before the call in every case.
   */
  enum class ChannelError {
    kInvalidParty = 1,
    kInvalidChallenge,
    kDuplicateChannel,
    kUnauthorized,
    kInvalidStatus,
    kAssetMismatch,
    kBalanceMismatch,
    kNonceTooLow,
    kInvalidSignature,
    kTransferFailed,
    kChallengePeriodNotElapsed,
    kNotFound,
    kInvalidAmount,
  };

}  // namespace pc::paych

OUTCOME_HPP_DECLARE_ERROR(pc::paych, ChannelError);
