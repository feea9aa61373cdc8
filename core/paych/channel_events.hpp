/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/signals2.hpp>
#include <functional>

#include "paych/channel.hpp"

namespace pc::paych {
  using Connection = boost::signals2::scoped_connection;

  struct ChannelOpen {
    ChannelId channel_id;
    Address agent_a;
    Address agent_b;
    AssetId asset;
    TokenAmount deposit_a;
    Duration challenge_period;
  };

  struct ChannelJoin {
    ChannelId channel_id;
    Address agent_a;
    Address agent_b;
    AssetId asset;
    TokenAmount deposit_a;
    TokenAmount deposit_b;
  };

  struct ChannelUpdateState {
    ChannelId channel_id;
    Nonce nonce{};
    TokenAmount balance_a;
    TokenAmount balance_b;
  };

  struct ChannelChallenge {
    ChannelId channel_id;
    Address challenger;
    UnixTime close_time;
  };

  struct ChannelClose {
    ChannelId channel_id;
    TokenAmount balance_a;
    TokenAmount balance_b;
  };

  /**
   * Notifications about committed transitions. Handlers run synchronously on
   * the thread that made the transition, after the channel state is
   * committed, in commit order. Handlers may query the manager but must not
   * start another transition.
   */
  struct ChannelEvents {
#define DEFINE_EVENT(STRUCT)                                         \
  using STRUCT##Callback = void(const STRUCT &);                     \
  Connection subscribe##STRUCT(std::function<STRUCT##Callback> cb) { \
    return STRUCT##_signal_.connect(cb);                             \
  }                                                                  \
  void signal##STRUCT(const STRUCT &event) {                         \
    STRUCT##_signal_(event);                                         \
  }                                                                  \
  boost::signals2::signal<STRUCT##Callback> STRUCT##_signal_

    DEFINE_EVENT(ChannelOpen);
    DEFINE_EVENT(ChannelJoin);
    DEFINE_EVENT(ChannelUpdateState);
    DEFINE_EVENT(ChannelChallenge);
    DEFINE_EVENT(ChannelClose);

#undef DEFINE_EVENT
  };
}  // namespace pc::paych
