/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "paych/state_digest.hpp"

namespace pc::paych {
  /**
   * EIP-712 signing domain. Binds signatures to one deployment so a state
   * signed for one escrow cannot be replayed against another.
   */
  struct Eip712Domain {
    std::string name;
    std::string version;
    uint64_t chain_id{};
    Address verifying_contract;
  };

  /**
   * Typed structured data digest (EIP-712), the format wallets display and
   * sign with eth_signTypedData_v4:
   * keccak256(0x1901 || domainSeparator || hashStruct(ChannelState))
   */
  class Eip712StateDigest : public StateDigest {
   public:
    static constexpr std::string_view kDomainType{
        "EIP712Domain(string name,string version,uint256 chainId,address "
        "verifyingContract)"};
    static constexpr std::string_view kStateType{
        "ChannelState(bytes32 channelId,uint256 nonce,uint256 balanceA,"
        "uint256 balanceB)"};

    explicit Eip712StateDigest(Eip712Domain domain);

    const Hash256 &domainSeparator() const;

    outcome::result<Hash256> structHash(const StateUpdate &state) const;

    outcome::result<Hash256> digest(const StateUpdate &state) const override;

   private:
    Eip712Domain domain_;
    Hash256 domain_separator_;
  };
}  // namespace pc::paych
