/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "paych/impl/eip712_state_digest.hpp"
#include "paych/impl/eth_message_state_digest.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace pc::paych {
  using primitives::BigInt;

  struct StateDigestTest : ::testing::Test {
    Eip712Domain domain{"PaymentChannel",
                        "1",
                        1,
                        "0xcccccccccccccccccccccccccccccccccccccccc"_address};
    StateUpdate state{
        "1111111111111111111111111111111111111111111111111111111111111111"_hash256,
        1,
        9,
        4};
  };

  /**
   * @given domain of the EIP-712 Ether Mail example
   * @when compute domain separator
   * @then value from the EIP-712 example
   */
  TEST_F(StateDigestTest, Eip712DomainSeparatorReference) {
    Eip712StateDigest digest{{"Ether Mail",
                              "1",
                              1,
                              "0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC"_address}};
    EXPECT_EQ(
        digest.domainSeparator(),
        "f2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090f"_hash256);
  }

  /**
   * @given domain and state update
   * @when compute EIP-712 digest
   * @then pinned separator, struct hash and digest
   */
  TEST_F(StateDigestTest, Eip712Digest) {
    Eip712StateDigest digest{domain};
    EXPECT_EQ(
        digest.domainSeparator(),
        "2c9b69958c48f0f05144ce1bd49eb7c2434272b25b63c7e7311599cb4a2463e6"_hash256);
    EXPECT_OUTCOME_EQ(
        digest.structHash(state),
        "ac804458e35a9b263ddec31fe8142f4475516ba53446fc8bc851e538e44723cf"_hash256);
    EXPECT_OUTCOME_EQ(
        digest.digest(state),
        "9a416dea53a8b6385c0bc0db3df04a3519fb5e6e3ccd22c5d134758b6a498506"_hash256);
  }

  /**
   * @given same state under domains differing in chain id
   * @when compute EIP-712 digest
   * @then digests differ
   */
  TEST_F(StateDigestTest, Eip712DomainBinding) {
    auto other_domain = domain;
    other_domain.chain_id = 5;
    EXPECT_OUTCOME_TRUE(first, Eip712StateDigest{domain}.digest(state));
    EXPECT_OUTCOME_TRUE(second, Eip712StateDigest{other_domain}.digest(state));
    EXPECT_NE(first, second);
  }

  /**
   * @given state update
   * @when compute Ethereum signed message digest
   * @then pinned fingerprint and digest
   */
  TEST_F(StateDigestTest, EthMessageDigest) {
    EthMessageStateDigest digest;
    EXPECT_OUTCOME_EQ(
        digest.fingerprint(state),
        "496bbb9f1b2a4c6acb2354d1ad17eb0af1e0653dcb7c3503ec3848d812e5c4fe"_hash256);
    EXPECT_OUTCOME_EQ(
        digest.digest(state),
        "7d2b74a1bb61fc6c82e9a82855f3cc73c74a54aff45b54ca1ffaf617eada4e76"_hash256);
  }

  /**
   * @given states differing in one field
   * @when compute digests
   * @then every field is bound
   */
  TEST_F(StateDigestTest, FieldsBound) {
    Eip712StateDigest digest{domain};
    EXPECT_OUTCOME_TRUE(expected, digest.digest(state));
    auto changed = state;
    changed.nonce = 2;
    EXPECT_OUTCOME_TRUE(by_nonce, digest.digest(changed));
    changed = state;
    changed.balance_a = 4;
    changed.balance_b = 9;
    EXPECT_OUTCOME_TRUE(by_balance, digest.digest(changed));
    changed = state;
    changed.channel_id[0] = 0;
    EXPECT_OUTCOME_TRUE(by_id, digest.digest(changed));
    EXPECT_NE(expected, by_nonce);
    EXPECT_NE(expected, by_balance);
    EXPECT_NE(expected, by_id);
  }

  /**
   * @given balance above uint256 or negative
   * @when compute digests
   * @then kValueOutOfRange
   */
  TEST_F(StateDigestTest, ValueOutOfRange) {
    auto huge = state;
    huge.balance_a = BigInt{1} << 256;
    EXPECT_OUTCOME_ERROR(StateDigestError::kValueOutOfRange,
                         Eip712StateDigest{domain}.digest(huge));
    EXPECT_OUTCOME_ERROR(StateDigestError::kValueOutOfRange,
                         EthMessageStateDigest{}.digest(huge));
    auto negative = state;
    negative.balance_b = -1;
    EXPECT_OUTCOME_ERROR(StateDigestError::kValueOutOfRange,
                         Eip712StateDigest{domain}.digest(negative));

    auto max = state;
    max.balance_a = (BigInt{1} << 256) - 1;
    EXPECT_OUTCOME_TRUE_1(Eip712StateDigest{domain}.digest(max));
  }
}  // namespace pc::paych
