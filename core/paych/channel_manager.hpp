/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "paych/channel.hpp"
#include "paych/channel_events.hpp"

namespace pc::paych {

  /**
   * ChannelManager runs the two-party payment channel lifecycle: agents lock
   * deposits in escrow, exchange signed balance updates off-channel, and
   * settle the last accepted split after a challenge period. Every operation
   * either completes or leaves channel and escrow as they were.
   */
  class ChannelManager {
   public:
    virtual ~ChannelManager() = default;

    /**
     * Opens channel and escrows opener deposit
     * @param opener - caller, becomes agent A
     * @param counterparty - agent B
     * @param asset - escrowed token
     * @param amount - opener deposit, may be zero
     * @param challenge_period - time agents have to answer a challenge
     * @return new channel id
     */
    virtual outcome::result<ChannelId> openChannel(
        const Address &opener,
        const Address &counterparty,
        const AssetId &asset,
        const TokenAmount &amount,
        Duration challenge_period) = 0;

    /**
     * Agent B joins the channel with own deposit
     * @param caller - must be agent B
     * @param id - channel
     * @param asset - must match channel asset
     * @param amount - agent B deposit, may be zero
     */
    virtual outcome::result<void> joinChannel(const Address &caller,
                                              const ChannelId &id,
                                              const AssetId &asset,
                                              const TokenAmount &amount) = 0;

    /**
     * Replaces channel balances with an update signed by both agents
     * @param caller - either agent
     * @param signed_state - update with nonce above the stored one
     */
    virtual outcome::result<void> updateState(
        const Address &caller, const SignedState &signed_state) = 0;

    /**
     * Starts the challenge period, after it elapses the channel can be
     * closed with the last accepted balances
     * @param caller - either agent
     * @param id - channel
     * @return close time
     */
    virtual outcome::result<UnixTime> startChallenge(const Address &caller,
                                                     const ChannelId &id) = 0;

    /**
     * Pays out balances to agents and removes the channel
     * @param caller - either agent
     * @param id - channel
     */
    virtual outcome::result<void> closeChannel(const Address &caller,
                                               const ChannelId &id) = 0;

    /**
     * @return channel snapshot or kNotFound
     */
    virtual outcome::result<Channel> getChannel(const ChannelId &id) const = 0;

    /**
     * Finds live channel between two agents, either role order
     */
    virtual boost::optional<ChannelId> findChannel(
        const Address &agent1,
        const Address &agent2,
        const AssetId &asset) const = 0;

    virtual ChannelEvents &events() = 0;
  };
}  // namespace pc::paych
