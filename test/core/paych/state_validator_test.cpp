/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/state_validator.hpp"

#include <gtest/gtest.h>

#include "paych/impl/eth_message_state_digest.hpp"
#include "paych/paych_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/paych/signature_verifier_mock.hpp"
#include "testutil/outcome.hpp"

namespace pc::paych {
  using testing::_;
  using testing::Return;

  struct StateValidatorTest : ::testing::Test {
    std::shared_ptr<StateDigest> digest{
        std::make_shared<EthMessageStateDigest>()};
    std::shared_ptr<SignatureVerifierMock> verifier{
        std::make_shared<SignatureVerifierMock>()};
    StateValidator validator{digest, verifier};

    Channel channel;
    SignedState signed_state;
    Hash256 hash;

    void SetUp() override {
      channel.id =
          "1111111111111111111111111111111111111111111111111111111111111111"_hash256;
      channel.agent_a = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"_address;
      channel.agent_b = "0x2b5ad5c4795c026514f8317c7a215e218dccd6cf"_address;
      channel.deposit_a = channel.balance_a = 10;
      channel.deposit_b = channel.balance_b = 3;
      channel.status = ChannelStatus::kJoined;

      signed_state.state = {channel.id, 1, 9, 4};
      signed_state.signature_a[0] = 0xaa;
      signed_state.signature_b[0] = 0xbb;
      hash = digest->digest(signed_state.state).value();
    }

    void expectSignatures(bool valid_a, bool valid_b) {
      ON_CALL(*verifier, verify(hash, signed_state.signature_a, channel.agent_a))
          .WillByDefault(Return(outcome::success(valid_a)));
      ON_CALL(*verifier, verify(hash, signed_state.signature_b, channel.agent_b))
          .WillByDefault(Return(outcome::success(valid_b)));
    }
  };

  /**
   * @given both agents signed balances adding up to deposits
   * @when validate
   * @then accepted
   */
  TEST_F(StateValidatorTest, Valid) {
    EXPECT_CALL(*verifier, verify(hash, _, _)).Times(2);
    expectSignatures(true, true);
    EXPECT_OUTCOME_TRUE_1(validator.validate(channel, signed_state));
  }

  /**
   * @given valid update on channel in Challenge
   * @when validate
   * @then accepted
   */
  TEST_F(StateValidatorTest, ValidInChallenge) {
    channel.status = ChannelStatus::kChallenge;
    expectSignatures(true, true);
    EXPECT_OUTCOME_TRUE_1(validator.validate(channel, signed_state));
  }

  /**
   * @given balances not adding up to deposits, or negative
   * @when validate
   * @then kBalanceMismatch before any signature check
   */
  TEST_F(StateValidatorTest, BalanceMismatch) {
    EXPECT_CALL(*verifier, verify(_, _, _)).Times(0);
    signed_state.state.balance_b = 5;
    EXPECT_OUTCOME_ERROR(ChannelError::kBalanceMismatch,
                         validator.validate(channel, signed_state));
    signed_state.state.balance_a = 14;
    signed_state.state.balance_b = -1;
    EXPECT_OUTCOME_ERROR(ChannelError::kBalanceMismatch,
                         validator.validate(channel, signed_state));
  }

  /**
   * @given channel not Joined nor in Challenge
   * @when validate
   * @then kInvalidStatus, balance check comes first
   */
  TEST_F(StateValidatorTest, InvalidStatus) {
    EXPECT_CALL(*verifier, verify(_, _, _)).Times(0);
    channel.status = ChannelStatus::kOpen;
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidStatus,
                         validator.validate(channel, signed_state));
    signed_state.state.balance_a = 0;
    EXPECT_OUTCOME_ERROR(ChannelError::kBalanceMismatch,
                         validator.validate(channel, signed_state));
  }

  /**
   * @given one of the signatures does not verify
   * @when validate
   * @then kInvalidSignature
   */
  TEST_F(StateValidatorTest, InvalidSignature) {
    expectSignatures(true, false);
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidSignature,
                         validator.validate(channel, signed_state));
    expectSignatures(false, true);
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidSignature,
                         validator.validate(channel, signed_state));
  }

  /**
   * @given only agent A signature valid
   * @when validate requiring A only or B only
   * @then requirement toggles which signature matters
   */
  TEST_F(StateValidatorTest, SingleSignatureRequirement) {
    expectSignatures(true, false);
    EXPECT_OUTCOME_TRUE_1(
        validator.validate(channel, signed_state, {true, false}));
    EXPECT_OUTCOME_ERROR(
        ChannelError::kInvalidSignature,
        validator.validate(channel, signed_state, {false, true}));
  }

  /**
   * @given verifier fails with error
   * @when validate
   * @then reported as kInvalidSignature
   */
  TEST_F(StateValidatorTest, VerifierError) {
    ON_CALL(*verifier, verify(_, _, _))
        .WillByDefault(Return(outcome::result<bool>{
            ChannelError::kTransferFailed}));
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidSignature,
                         validator.validate(channel, signed_state));
  }

  /**
   * @given update for another channel id
   * @when validate
   * @then kInvalidSignature
   */
  TEST_F(StateValidatorTest, ForeignChannelId) {
    expectSignatures(true, true);
    signed_state.state.channel_id[0] = 0;
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidSignature,
                         validator.validate(channel, signed_state));
  }
}  // namespace pc::paych
