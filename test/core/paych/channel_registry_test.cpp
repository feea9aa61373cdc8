/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/channel_registry.hpp"

#include <gtest/gtest.h>

#include "paych/paych_error.hpp"
#include "testutil/default_print.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace pc::paych {

  struct ChannelRegistryTest : ::testing::Test {
    ChannelRegistry registry;
    Address agent_a{"0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"_address};
    Address agent_b{"0x2b5ad5c4795c026514f8317c7a215e218dccd6cf"_address};
    AssetId token{"0xcccccccccccccccccccccccccccccccccccccccc"_address};

    Channel makeChannel(const Address &opener,
                        const Address &counterparty,
                        const AssetId &asset,
                        UnixTime time = UnixTime{1000}) {
      Channel channel;
      channel.id = makeChannelId(opener, counterparty, asset, time);
      channel.agent_a = opener;
      channel.agent_b = counterparty;
      channel.asset = asset;
      channel.deposit_a = channel.balance_a = 10;
      channel.challenge_period = Duration{6000};
      return channel;
    }
  };

  /**
   * @given registered channel
   * @when lookup and findActive in both role orders
   * @then stored record and its id are returned
   */
  TEST_F(ChannelRegistryTest, InsertLookup) {
    auto channel = makeChannel(agent_a, agent_b, AssetId{});
    EXPECT_OUTCOME_TRUE_1(registry.insert(channel));
    EXPECT_OUTCOME_EQ(registry.lookup(channel.id), channel);
    EXPECT_EQ(registry.findActive(agent_a, agent_b, AssetId{}), channel.id);
    EXPECT_EQ(registry.findActive(agent_b, agent_a, AssetId{}), channel.id);
    EXPECT_FALSE(registry.findActive(agent_a, agent_b, token));
    EXPECT_TRUE(registry.contains(channel.id));
    EXPECT_EQ(registry.size(), 1);
  }

  /**
   * @given registered channel
   * @when insert channel for the same pair and asset in either role order
   * @then kDuplicateChannel, other asset is allowed
   */
  TEST_F(ChannelRegistryTest, Duplicate) {
    EXPECT_OUTCOME_TRUE_1(
        registry.insert(makeChannel(agent_a, agent_b, AssetId{})));
    EXPECT_OUTCOME_ERROR(
        ChannelError::kDuplicateChannel,
        registry.insert(makeChannel(agent_a, agent_b, AssetId{}, UnixTime{2000})));
    EXPECT_OUTCOME_ERROR(
        ChannelError::kDuplicateChannel,
        registry.insert(makeChannel(agent_b, agent_a, AssetId{}, UnixTime{2000})));
    EXPECT_OUTCOME_TRUE_1(registry.insert(makeChannel(agent_a, agent_b, token)));
    EXPECT_EQ(registry.size(), 2);
  }

  /**
   * @given channel with taken id
   * @when insert
   * @then kDuplicateChannel
   */
  TEST_F(ChannelRegistryTest, DuplicateId) {
    auto channel = makeChannel(agent_a, agent_b, AssetId{});
    EXPECT_OUTCOME_TRUE_1(registry.insert(channel));
    auto other = makeChannel(agent_a, token, AssetId{});
    other.id = channel.id;
    EXPECT_OUTCOME_ERROR(ChannelError::kDuplicateChannel, registry.insert(other));
  }

  /**
   * @given registered channel
   * @when update record
   * @then lookup returns new record, unknown id is kNotFound
   */
  TEST_F(ChannelRegistryTest, Update) {
    auto channel = makeChannel(agent_a, agent_b, AssetId{});
    EXPECT_OUTCOME_TRUE_1(registry.insert(channel));
    channel.status = ChannelStatus::kJoined;
    channel.nonce = 3;
    EXPECT_OUTCOME_TRUE_1(registry.update(channel));
    EXPECT_OUTCOME_EQ(registry.lookup(channel.id), channel);

    EXPECT_OUTCOME_ERROR(ChannelError::kNotFound,
                         registry.update(makeChannel(agent_a, agent_b, token)));
  }

  /**
   * @given registered channel
   * @when remove
   * @then record and pair index are gone, pair can open again
   */
  TEST_F(ChannelRegistryTest, Remove) {
    auto channel = makeChannel(agent_a, agent_b, AssetId{});
    EXPECT_OUTCOME_TRUE_1(registry.insert(channel));
    EXPECT_OUTCOME_TRUE_1(registry.remove(channel.id));
    EXPECT_OUTCOME_ERROR(ChannelError::kNotFound, registry.lookup(channel.id));
    EXPECT_OUTCOME_ERROR(ChannelError::kNotFound, registry.remove(channel.id));
    EXPECT_FALSE(registry.findActive(agent_a, agent_b, AssetId{}));
    EXPECT_EQ(registry.size(), 0);
    EXPECT_OUTCOME_TRUE_1(registry.insert(
        makeChannel(agent_b, agent_a, AssetId{}, UnixTime{2000})));
  }
}  // namespace pc::paych
