/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/channel_registry.hpp"

#include "paych/paych_error.hpp"

namespace pc::paych {

  ChannelRegistry::PairKey ChannelRegistry::pairKey(const Address &agent1,
                                                    const Address &agent2,
                                                    const AssetId &asset) {
    if (agent2 < agent1) {
      return {agent2, agent1, asset};
    }
    return {agent1, agent2, asset};
  }

  outcome::result<void> ChannelRegistry::insert(const Channel &channel) {
    auto key = pairKey(channel.agent_a, channel.agent_b, channel.asset);
    if (channels_.count(channel.id) != 0 || by_pair_.count(key) != 0) {
      return ChannelError::kDuplicateChannel;
    }
    channels_.emplace(channel.id, channel);
    by_pair_.emplace(std::move(key), channel.id);
    return outcome::success();
  }

  outcome::result<Channel> ChannelRegistry::lookup(const ChannelId &id) const {
    auto it = channels_.find(id);
    if (it == channels_.end()) {
      return ChannelError::kNotFound;
    }
    return it->second;
  }

  outcome::result<void> ChannelRegistry::update(const Channel &channel) {
    auto it = channels_.find(channel.id);
    if (it == channels_.end()) {
      return ChannelError::kNotFound;
    }
    it->second = channel;
    return outcome::success();
  }

  outcome::result<void> ChannelRegistry::remove(const ChannelId &id) {
    auto it = channels_.find(id);
    if (it == channels_.end()) {
      return ChannelError::kNotFound;
    }
    const auto &channel = it->second;
    by_pair_.erase(pairKey(channel.agent_a, channel.agent_b, channel.asset));
    channels_.erase(it);
    return outcome::success();
  }

  boost::optional<ChannelId> ChannelRegistry::findActive(
      const Address &agent1,
      const Address &agent2,
      const AssetId &asset) const {
    auto it = by_pair_.find(pairKey(agent1, agent2, asset));
    if (it == by_pair_.end()) {
      return boost::none;
    }
    return it->second;
  }

  bool ChannelRegistry::contains(const ChannelId &id) const {
    return channels_.count(id) != 0;
  }

  size_t ChannelRegistry::size() const {
    return channels_.size();
  }
}  // namespace pc::paych
