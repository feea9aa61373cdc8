/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "clock/time.hpp"
#include "common/cmp.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace pc::paych {
  using clock::Duration;
  using clock::UnixTime;
  using common::Hash256;
  using crypto::secp256k1::Signature;
  using primitives::Nonce;
  using primitives::TokenAmount;
  using primitives::address::Address;

  using ChannelId = Hash256;

  /** Token the channel escrows, null address for the native coin */
  using AssetId = Address;

  enum class ChannelStatus : uint8_t {
    kOpen = 0,
    kJoined = 1,
    kChallenge = 2,
    /** Terminal, never stored: closed channels are removed */
    kClosed = 3,
  };

  std::string_view statusName(ChannelStatus status);

  struct Channel {
    ChannelId id;
    Address agent_a;
    Address agent_b;
    AssetId asset;
    TokenAmount deposit_a{};
    TokenAmount deposit_b{};
    TokenAmount balance_a{};
    TokenAmount balance_b{};
    ChannelStatus status{ChannelStatus::kOpen};
    Duration challenge_period{};
    /** Nonce of the last accepted state update */
    Nonce nonce{};
    /** Set when the challenge starts, Close is allowed strictly after it */
    UnixTime close_time{};
    /** Agent who started the challenge, null before */
    Address challenger;
    /**
     * Payout to agent A left escrow during a close that failed afterwards and
     * could not be taken back. Balances are frozen, Close pays only B.
     */
    bool paid_a{false};

    bool isParty(const Address &address) const {
      return address == agent_a || address == agent_b;
    }

    TokenAmount totalDeposit() const {
      return deposit_a + deposit_b;
    }

    bool operator==(const Channel &other) const {
      return id == other.id && agent_a == other.agent_a
             && agent_b == other.agent_b && asset == other.asset
             && deposit_a == other.deposit_a && deposit_b == other.deposit_b
             && balance_a == other.balance_a && balance_b == other.balance_b
             && status == other.status
             && challenge_period == other.challenge_period
             && nonce == other.nonce && close_time == other.close_time
             && challenger == other.challenger && paid_a == other.paid_a;
    }
  };
  PC_OPERATOR_NOT_EQUAL(Channel)

  /**
   * Balance split both agents agree on off-channel. Its digest is what the
   * agents sign.
   */
  struct StateUpdate {
    ChannelId channel_id;
    Nonce nonce{};
    TokenAmount balance_a{};
    TokenAmount balance_b{};
  };

  struct SignedState {
    StateUpdate state;
    Signature signature_a;
    Signature signature_b;
  };

  /**
   * Derives channel id as keccak256 of opener, counterparty and asset
   * addresses followed by the creation time as 32-byte big-endian word
   */
  ChannelId makeChannelId(const Address &opener,
                          const Address &counterparty,
                          const AssetId &asset,
                          UnixTime created);
}  // namespace pc::paych
