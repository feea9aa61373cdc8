/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/state_validator.hpp"

#include "common/logger.hpp"
#include "paych/paych_error.hpp"

namespace pc::paych {
  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("paych");
      return logger;
    }
  }  // namespace

  StateValidator::StateValidator(std::shared_ptr<StateDigest> digest,
                                 std::shared_ptr<SignatureVerifier> verifier)
      : digest_{std::move(digest)}, verifier_{std::move(verifier)} {}

  outcome::result<void> StateValidator::validate(
      const Channel &channel,
      const SignedState &signed_state,
      SignatureRequirement requirement) const {
    const auto &state = signed_state.state;
    if (state.balance_a < 0 || state.balance_b < 0
        || state.balance_a + state.balance_b != channel.totalDeposit()) {
      return ChannelError::kBalanceMismatch;
    }
    if (channel.status != ChannelStatus::kJoined
        && channel.status != ChannelStatus::kChallenge) {
      return ChannelError::kInvalidStatus;
    }
    if (state.channel_id != channel.id) {
      // signatures bind the id, a foreign id cannot verify for this channel
      return ChannelError::kInvalidSignature;
    }

    OUTCOME_TRY(hash, digest_->digest(state));
    if (requirement.require_a) {
      OUTCOME_TRY(valid,
                  verifyAgent(hash, signed_state.signature_a, channel.agent_a));
      if (!valid) {
        return ChannelError::kInvalidSignature;
      }
    }
    if (requirement.require_b) {
      OUTCOME_TRY(valid,
                  verifyAgent(hash, signed_state.signature_b, channel.agent_b));
      if (!valid) {
        return ChannelError::kInvalidSignature;
      }
    }
    return outcome::success();
  }

  outcome::result<bool> StateValidator::verifyAgent(
      const Hash256 &digest,
      const Signature &signature,
      const Address &agent) const {
    auto verified = verifier_->verify(digest, signature, agent);
    if (!verified) {
      logger()->warn("signature verification for {} failed: {}",
                     agent.toString(),
                     verified.error().message());
      return false;
    }
    return verified.value();
  }
}  // namespace pc::paych
