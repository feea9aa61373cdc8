/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/impl/channel_manager_impl.hpp"

#include "paych/lifecycle.hpp"
#include "paych/paych_error.hpp"

namespace pc::paych {

  ChannelManagerImpl::ChannelManagerImpl(
      Duration min_challenge_period,
      std::shared_ptr<EscrowLedger> ledger,
      std::shared_ptr<StateValidator> validator,
      std::shared_ptr<UTCClock> clock)
      : min_challenge_period_{min_challenge_period},
        ledger_{std::move(ledger)},
        validator_{std::move(validator)},
        clock_{std::move(clock)},
        logger_{common::createLogger("paych")} {}

  outcome::result<ChannelId> ChannelManagerImpl::openChannel(
      const Address &opener,
      const Address &counterparty,
      const AssetId &asset,
      const TokenAmount &amount,
      Duration challenge_period) {
    std::lock_guard emit_lock{emit_mutex_};
    auto event =
        applyOpen(opener, counterparty, asset, amount, challenge_period);
    if (!event) {
      logger_->debug("open {} -> {} refused: {}",
                     opener.toString(),
                     counterparty.toString(),
                     event.error().message());
      return event.error();
    }
    logger_->info("channel {} opened by {} with {}, deposit {}",
                  event.value().channel_id.toHex(),
                  opener.toString(),
                  counterparty.toString(),
                  amount.str());
    events_.signalChannelOpen(event.value());
    return event.value().channel_id;
  }

  outcome::result<void> ChannelManagerImpl::joinChannel(
      const Address &caller,
      const ChannelId &id,
      const AssetId &asset,
      const TokenAmount &amount) {
    std::lock_guard emit_lock{emit_mutex_};
    auto event = applyJoin(caller, id, asset, amount);
    if (!event) {
      logger_->debug("join {} by {} refused: {}",
                     id.toHex(),
                     caller.toString(),
                     event.error().message());
      return event.error();
    }
    logger_->info("channel {} joined, deposit {}", id.toHex(), amount.str());
    events_.signalChannelJoin(event.value());
    return outcome::success();
  }

  outcome::result<void> ChannelManagerImpl::updateState(
      const Address &caller, const SignedState &signed_state) {
    const auto &state = signed_state.state;
    std::lock_guard emit_lock{emit_mutex_};
    auto event = applyUpdate(caller, signed_state);
    if (!event) {
      logger_->debug("update {} nonce {} by {} refused: {}",
                     state.channel_id.toHex(),
                     state.nonce,
                     caller.toString(),
                     event.error().message());
      return event.error();
    }
    logger_->info("channel {} state {}: {} / {}",
                  state.channel_id.toHex(),
                  state.nonce,
                  state.balance_a.str(),
                  state.balance_b.str());
    events_.signalChannelUpdateState(event.value());
    return outcome::success();
  }

  outcome::result<UnixTime> ChannelManagerImpl::startChallenge(
      const Address &caller, const ChannelId &id) {
    std::lock_guard emit_lock{emit_mutex_};
    auto event = applyChallenge(caller, id);
    if (!event) {
      logger_->debug("challenge {} by {} refused: {}",
                     id.toHex(),
                     caller.toString(),
                     event.error().message());
      return event.error();
    }
    logger_->info("channel {} challenged by {}, closes after {}",
                  id.toHex(),
                  caller.toString(),
                  event.value().close_time.count());
    events_.signalChannelChallenge(event.value());
    return event.value().close_time;
  }

  outcome::result<void> ChannelManagerImpl::closeChannel(const Address &caller,
                                                         const ChannelId &id) {
    std::lock_guard emit_lock{emit_mutex_};
    auto event = applyClose(caller, id);
    if (!event) {
      logger_->debug("close {} by {} refused: {}",
                     id.toHex(),
                     caller.toString(),
                     event.error().message());
      return event.error();
    }
    logger_->info("channel {} closed, paid {} / {}",
                  id.toHex(),
                  event.value().balance_a.str(),
                  event.value().balance_b.str());
    events_.signalChannelClose(event.value());
    return outcome::success();
  }

  outcome::result<Channel> ChannelManagerImpl::getChannel(
      const ChannelId &id) const {
    std::shared_lock lock{mutex_};
    return registry_.lookup(id);
  }

  boost::optional<ChannelId> ChannelManagerImpl::findChannel(
      const Address &agent1,
      const Address &agent2,
      const AssetId &asset) const {
    std::shared_lock lock{mutex_};
    return registry_.findActive(agent1, agent2, asset);
  }

  ChannelEvents &ChannelManagerImpl::events() {
    return events_;
  }

  outcome::result<ChannelOpen> ChannelManagerImpl::applyOpen(
      const Address &opener,
      const Address &counterparty,
      const AssetId &asset,
      const TokenAmount &amount,
      Duration challenge_period) {
    if (opener.isNull() || counterparty.isNull() || opener == counterparty) {
      return ChannelError::kInvalidParty;
    }
    if (challenge_period <= Duration::zero()
        || challenge_period < min_challenge_period_) {
      return ChannelError::kInvalidChallenge;
    }
    if (amount < 0) {
      return ChannelError::kInvalidAmount;
    }

    std::unique_lock lock{mutex_};
    const auto now = clock_->nowUTC();
    // deadline must stay representable for the whole channel life
    if (!clock::addDuration(now, challenge_period)) {
      return ChannelError::kInvalidChallenge;
    }
    if (registry_.findActive(opener, counterparty, asset)) {
      return ChannelError::kDuplicateChannel;
    }
    const auto id = makeChannelId(opener, counterparty, asset, now);
    if (registry_.contains(id)) {
      return ChannelError::kDuplicateChannel;
    }

    OUTCOME_TRY(escrowIn(opener, asset, amount));

    Channel channel;
    channel.id = id;
    channel.agent_a = opener;
    channel.agent_b = counterparty;
    channel.asset = asset;
    channel.deposit_a = amount;
    channel.balance_a = amount;
    channel.status = ChannelStatus::kOpen;
    channel.challenge_period = challenge_period;
    if (auto inserted = registry_.insert(channel); !inserted) {
      refund(opener, asset, amount);
      return inserted.error();
    }
    return ChannelOpen{
        id, opener, counterparty, asset, amount, challenge_period};
  }

  outcome::result<ChannelJoin> ChannelManagerImpl::applyJoin(
      const Address &caller,
      const ChannelId &id,
      const AssetId &asset,
      const TokenAmount &amount) {
    std::unique_lock lock{mutex_};
    OUTCOME_TRY(channel, registry_.lookup(id));
    OUTCOME_TRY(checkTransition(channel, caller, Transition::kJoin));
    if (asset != channel.asset) {
      return ChannelError::kAssetMismatch;
    }
    if (amount < 0) {
      return ChannelError::kInvalidAmount;
    }

    OUTCOME_TRY(escrowIn(caller, asset, amount));

    channel.deposit_b = amount;
    channel.balance_b = amount;
    channel.status = ChannelStatus::kJoined;
    if (auto updated = registry_.update(channel); !updated) {
      refund(caller, asset, amount);
      return updated.error();
    }
    return ChannelJoin{channel.id,
                       channel.agent_a,
                       channel.agent_b,
                       channel.asset,
                       channel.deposit_a,
                       channel.deposit_b};
  }

  outcome::result<ChannelUpdateState> ChannelManagerImpl::applyUpdate(
      const Address &caller, const SignedState &signed_state) {
    const auto &state = signed_state.state;
    std::unique_lock lock{mutex_};
    OUTCOME_TRY(channel, registry_.lookup(state.channel_id));
    OUTCOME_TRY(checkTransition(channel, caller, Transition::kUpdateState));
    OUTCOME_TRY(validator_->validate(channel, signed_state));
    if (state.nonce <= channel.nonce) {
      return ChannelError::kNonceTooLow;
    }

    channel.nonce = state.nonce;
    channel.balance_a = state.balance_a;
    channel.balance_b = state.balance_b;
    OUTCOME_TRY(registry_.update(channel));
    return ChannelUpdateState{
        channel.id, channel.nonce, channel.balance_a, channel.balance_b};
  }

  outcome::result<ChannelChallenge> ChannelManagerImpl::applyChallenge(
      const Address &caller, const ChannelId &id) {
    std::unique_lock lock{mutex_};
    OUTCOME_TRY(channel, registry_.lookup(id));
    OUTCOME_TRY(checkTransition(channel, caller, Transition::kStartChallenge));
    auto close_time =
        clock::addDuration(clock_->nowUTC(), channel.challenge_period);
    if (!close_time) {
      return ChannelError::kInvalidChallenge;
    }

    channel.status = ChannelStatus::kChallenge;
    channel.close_time = close_time.value();
    channel.challenger = caller;
    OUTCOME_TRY(registry_.update(channel));
    return ChannelChallenge{channel.id, caller, channel.close_time};
  }

  outcome::result<ChannelClose> ChannelManagerImpl::applyClose(
      const Address &caller, const ChannelId &id) {
    std::unique_lock lock{mutex_};
    OUTCOME_TRY(channel, registry_.lookup(id));
    OUTCOME_TRY(checkTransition(channel, caller, Transition::kClose));
    if (clock_->nowUTC() <= channel.close_time) {
      return ChannelError::kChallengePeriodNotElapsed;
    }

    // taken out before funds move, put back if settlement fails
    OUTCOME_TRY(registry_.remove(channel.id));

    const auto paid_a_before = channel.paid_a;
    if (!paid_a_before) {
      if (auto paid_a =
              escrowOut(channel.agent_a, channel.asset, channel.balance_a);
          !paid_a) {
        restore(channel);
        return paid_a.error();
      }
      channel.paid_a = true;
    }
    if (auto paid_b =
            escrowOut(channel.agent_b, channel.asset, channel.balance_b);
        !paid_b) {
      if (!paid_a_before) {
        if (channel.balance_a == 0) {
          channel.paid_a = false;
        } else if (auto reclaimed = ledger_->transferIn(
                       channel.agent_a, channel.asset, channel.balance_a)) {
          channel.paid_a = false;
        } else {
          // retry of Close must not pay A again
          logger_->critical(
              "channel {}: cannot reclaim {} paid to {}: {}",
              channel.id.toHex(),
              channel.balance_a.str(),
              channel.agent_a.toString(),
              reclaimed.error().message());
        }
      }
      restore(channel);
      return paid_b.error();
    }

    return ChannelClose{channel.id, channel.balance_a, channel.balance_b};
  }

  void ChannelManagerImpl::refund(const Address &payee,
                                  const AssetId &asset,
                                  const TokenAmount &amount) {
    if (!escrowOut(payee, asset, amount)) {
      logger_->critical("refund of {} to {} failed, escrow out of balance",
                        amount.str(),
                        payee.toString());
    }
  }

  void ChannelManagerImpl::restore(const Channel &channel) {
    if (auto inserted = registry_.insert(channel); !inserted) {
      logger_->critical("channel {}: cannot restore record: {}",
                        channel.id.toHex(),
                        inserted.error().message());
    }
  }

  outcome::result<void> ChannelManagerImpl::escrowIn(
      const Address &payer, const AssetId &asset, const TokenAmount &amount) {
    if (amount == 0) {
      return outcome::success();
    }
    auto transferred = ledger_->transferIn(payer, asset, amount);
    if (!transferred) {
      logger_->debug("escrow of {} from {} failed: {}",
                     amount.str(),
                     payer.toString(),
                     transferred.error().message());
      return ChannelError::kTransferFailed;
    }
    return outcome::success();
  }

  outcome::result<void> ChannelManagerImpl::escrowOut(
      const Address &payee, const AssetId &asset, const TokenAmount &amount) {
    if (amount == 0) {
      return outcome::success();
    }
    auto transferred = ledger_->transferOut(payee, asset, amount);
    if (!transferred) {
      logger_->debug("payout of {} to {} failed: {}",
                     amount.str(),
                     payee.toString(),
                     transferred.error().message());
      return ChannelError::kTransferFailed;
    }
    return outcome::success();
  }
}  // namespace pc::paych
