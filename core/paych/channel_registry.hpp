/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <map>
#include <tuple>

#include "paych/channel.hpp"

namespace pc::paych {

  /**
   * Channel records by id with a secondary index by agent pair and asset.
   * At most one live channel exists per unordered agent pair and asset.
   * Not synchronized, the owner serializes access.
   */
  class ChannelRegistry {
   public:
    /**
     * Stores new channel
     * @return kDuplicateChannel if id is taken or the pair already has a live
     * channel for the asset
     */
    outcome::result<void> insert(const Channel &channel);

    /**
     * @return copy of the channel record or kNotFound
     */
    outcome::result<Channel> lookup(const ChannelId &id) const;

    /**
     * Replaces stored record, agents and asset must not change
     * @return kNotFound if there is no record with the id
     */
    outcome::result<void> update(const Channel &channel);

    /**
     * Removes the record and releases the agent pair
     * @return kNotFound if there is no record with the id
     */
    outcome::result<void> remove(const ChannelId &id);

    /**
     * Looks up live channel between two agents in either role order
     */
    boost::optional<ChannelId> findActive(const Address &agent1,
                                          const Address &agent2,
                                          const AssetId &asset) const;

    bool contains(const ChannelId &id) const;

    size_t size() const;

   private:
    /** Lower address first so both role orders map to the same key */
    using PairKey = std::tuple<Address, Address, AssetId>;

    static PairKey pairKey(const Address &agent1,
                           const Address &agent2,
                           const AssetId &asset);

    std::map<ChannelId, Channel> channels_;
    std::map<PairKey, ChannelId> by_pair_;
  };
}  // namespace pc::paych
