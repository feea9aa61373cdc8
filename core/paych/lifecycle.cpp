/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/lifecycle.hpp"

#include "paych/paych_error.hpp"

namespace pc::paych {

  outcome::result<void> checkTransition(const Channel &channel,
                                        const Address &caller,
                                        Transition transition) {
    const auto status = channel.status;
    switch (transition) {
      case Transition::kJoin:
        if (caller != channel.agent_b) {
          return ChannelError::kUnauthorized;
        }
        if (status != ChannelStatus::kOpen) {
          return ChannelError::kInvalidStatus;
        }
        break;
      case Transition::kUpdateState:
        if (!channel.isParty(caller)) {
          return ChannelError::kUnauthorized;
        }
        if ((status != ChannelStatus::kJoined
             && status != ChannelStatus::kChallenge)
            || channel.paid_a) {
          return ChannelError::kInvalidStatus;
        }
        break;
      case Transition::kStartChallenge:
        if (!channel.isParty(caller)) {
          return ChannelError::kUnauthorized;
        }
        if (status != ChannelStatus::kOpen && status != ChannelStatus::kJoined) {
          return ChannelError::kInvalidStatus;
        }
        break;
      case Transition::kClose:
        if (!channel.isParty(caller)) {
          return ChannelError::kUnauthorized;
        }
        if (status != ChannelStatus::kChallenge) {
          return ChannelError::kInvalidStatus;
        }
        break;
    }
    return outcome::success();
  }
}  // namespace pc::paych
