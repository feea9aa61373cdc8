/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/impl/eth_message_state_digest.hpp"

#include "common/span.hpp"
#include "paych/impl/abi_encoder.hpp"

namespace pc::paych {
  constexpr std::string_view kMessagePrefix{
      "\x19"
      "Ethereum Signed Message:\n32"};

  outcome::result<Hash256> EthMessageStateDigest::fingerprint(
      const StateUpdate &state) const {
    AbiEncoder encoder;
    encoder.putWord(state.channel_id);
    encoder.putUint(state.nonce);
    OUTCOME_TRY(encoder.putUint(state.balance_a));
    OUTCOME_TRY(encoder.putUint(state.balance_b));
    return encoder.hash();
  }

  outcome::result<Hash256> EthMessageStateDigest::digest(
      const StateUpdate &state) const {
    OUTCOME_TRY(hash, fingerprint(state));
    crypto::keccak::Ctx ctx;
    ctx.update(common::span::cbytes(kMessagePrefix));
    ctx.update(hash);
    return ctx.final();
  }
}  // namespace pc::paych
