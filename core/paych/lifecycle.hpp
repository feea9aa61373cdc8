/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "paych/channel.hpp"

namespace pc::paych {

  /** Channel transitions initiated by an agent after Open */
  enum class Transition {
    kJoin,
    kUpdateState,
    kStartChallenge,
    kClose,
  };

  /**
   * Checks that caller may request the transition and that the channel
   * status allows it.
   *
   *   Join            agent_b only, Open
   *   UpdateState     either agent, Joined or Challenge, A not paid yet
   *   StartChallenge  either agent, Open or Joined
   *   Close           either agent, Challenge
   *
   * @return kUnauthorized for a wrong caller, checked first, then
   * kInvalidStatus
   */
  outcome::result<void> checkTransition(const Channel &channel,
                                        const Address &caller,
                                        Transition transition);
}  // namespace pc::paych
