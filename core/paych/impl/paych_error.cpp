/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/paych_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pc::paych, ChannelError, e) {
  using E = pc::paych::ChannelError;
  switch (e) {
    case E::kInvalidParty:
      return "Paych: counterparty is null or equals opener";
    case E::kInvalidChallenge:
      return "Paych: challenge period is zero or too short";
    case E::kDuplicateChannel:
      return "Paych: active channel already exists for the pair and asset";
    case E::kUnauthorized:
      return "Paych: caller is not allowed to perform this transition";
    case E::kInvalidStatus:
      return "Paych: transition is not allowed in the current status";
    case E::kAssetMismatch:
      return "Paych: asset does not match the channel asset";
    case E::kBalanceMismatch:
      return "Paych: balances do not add up to the total deposit";
    case E::kNonceTooLow:
      return "Paych: nonce is not greater than the stored nonce";
    case E::kInvalidSignature:
      return "Paych: signature does not match the agent";
    case E::kTransferFailed:
      return "Paych: escrow transfer failed";
    case E::kChallengePeriodNotElapsed:
      return "Paych: challenge period has not elapsed yet";
    case E::kNotFound:
      return "Paych: channel not found";
    case E::kInvalidAmount:
      return "Paych: amount is negative";
  }
  return "Paych: unknown error";
}
