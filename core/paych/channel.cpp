/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/channel.hpp"

#include "crypto/keccak/keccak.hpp"

namespace pc::paych {
  std::string_view statusName(ChannelStatus status) {
    switch (status) {
      case ChannelStatus::kOpen:
        return "Open";
      case ChannelStatus::kJoined:
        return "Joined";
      case ChannelStatus::kChallenge:
        return "Challenge";
      case ChannelStatus::kClosed:
        return "Closed";
    }
    return "Unknown";
  }

  ChannelId makeChannelId(const Address &opener,
                          const Address &counterparty,
                          const AssetId &asset,
                          UnixTime created) {
    crypto::keccak::Ctx ctx;
    ctx.update(opener);
    ctx.update(counterparty);
    ctx.update(asset);
    BytesN<32> time_word{};
    auto seconds = static_cast<uint64_t>(created.count());
    for (size_t i = 0; i < sizeof(seconds); ++i) {
      time_word[time_word.size() - 1 - i] = static_cast<uint8_t>(seconds);
      seconds >>= 8;
    }
    ctx.update(time_word);
    return ctx.final();
  }
}  // namespace pc::paych
