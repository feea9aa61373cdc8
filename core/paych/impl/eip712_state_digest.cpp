/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/impl/eip712_state_digest.hpp"

#include "common/span.hpp"
#include "paych/impl/abi_encoder.hpp"

namespace pc::paych {
  using common::span::cbytes;
  using crypto::keccak::keccak256;

  namespace {
    constexpr std::array<uint8_t, 2> kTypedDataPrefix{0x19, 0x01};

    Hash256 hashDomain(const Eip712Domain &domain) {
      AbiEncoder encoder;
      encoder.putWord(keccak256(cbytes(Eip712StateDigest::kDomainType)));
      encoder.putWord(keccak256(cbytes(domain.name)));
      encoder.putWord(keccak256(cbytes(domain.version)));
      encoder.putUint(domain.chain_id);
      encoder.putAddress(domain.verifying_contract);
      return encoder.hash();
    }
  }  // namespace

  Eip712StateDigest::Eip712StateDigest(Eip712Domain domain)
      : domain_{std::move(domain)}, domain_separator_{hashDomain(domain_)} {}

  const Hash256 &Eip712StateDigest::domainSeparator() const {
    return domain_separator_;
  }

  outcome::result<Hash256> Eip712StateDigest::structHash(
      const StateUpdate &state) const {
    AbiEncoder encoder;
    encoder.putWord(keccak256(cbytes(kStateType)));
    encoder.putWord(state.channel_id);
    encoder.putUint(state.nonce);
    OUTCOME_TRY(encoder.putUint(state.balance_a));
    OUTCOME_TRY(encoder.putUint(state.balance_b));
    return encoder.hash();
  }

  outcome::result<Hash256> Eip712StateDigest::digest(
      const StateUpdate &state) const {
    OUTCOME_TRY(struct_hash, structHash(state));
    crypto::keccak::Ctx ctx;
    ctx.update(kTypedDataPrefix);
    ctx.update(domain_separator_);
    ctx.update(struct_hash);
    return ctx.final();
  }
}  // namespace pc::paych
