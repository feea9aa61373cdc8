/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <shared_mutex>

#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "paych/channel_manager.hpp"
#include "paych/channel_registry.hpp"
#include "paych/escrow_ledger.hpp"
#include "paych/state_validator.hpp"

namespace pc::paych {
  using clock::UTCClock;

  class ChannelManagerImpl : public ChannelManager {
   public:
    /**
     * @param min_challenge_period - shortest challenge period Open accepts
     * @param ledger - escrow holding deposits
     * @param validator - checks signed state updates
     * @param clock - source of now for challenge deadlines
     */
    ChannelManagerImpl(Duration min_challenge_period,
                       std::shared_ptr<EscrowLedger> ledger,
                       std::shared_ptr<StateValidator> validator,
                       std::shared_ptr<UTCClock> clock);

    outcome::result<ChannelId> openChannel(const Address &opener,
                                           const Address &counterparty,
                                           const AssetId &asset,
                                           const TokenAmount &amount,
                                           Duration challenge_period) override;

    outcome::result<void> joinChannel(const Address &caller,
                                      const ChannelId &id,
                                      const AssetId &asset,
                                      const TokenAmount &amount) override;

    outcome::result<void> updateState(const Address &caller,
                                      const SignedState &signed_state) override;

    outcome::result<UnixTime> startChallenge(const Address &caller,
                                             const ChannelId &id) override;

    outcome::result<void> closeChannel(const Address &caller,
                                       const ChannelId &id) override;

    outcome::result<Channel> getChannel(const ChannelId &id) const override;

    boost::optional<ChannelId> findChannel(
        const Address &agent1,
        const Address &agent2,
        const AssetId &asset) const override;

    ChannelEvents &events() override;

   private:
    /*
     * apply* run under the writer lock and return the event to emit once
     * the lock is released. Callers hold emit_mutex_ from before apply* until
     * the event is emitted, so events leave in commit order.
     */

    outcome::result<ChannelOpen> applyOpen(const Address &opener,
                                           const Address &counterparty,
                                           const AssetId &asset,
                                           const TokenAmount &amount,
                                           Duration challenge_period);

    outcome::result<ChannelJoin> applyJoin(const Address &caller,
                                           const ChannelId &id,
                                           const AssetId &asset,
                                           const TokenAmount &amount);

    outcome::result<ChannelUpdateState> applyUpdate(
        const Address &caller, const SignedState &signed_state);

    outcome::result<ChannelChallenge> applyChallenge(const Address &caller,
                                                     const ChannelId &id);

    outcome::result<ChannelClose> applyClose(const Address &caller,
                                             const ChannelId &id);

    /** Pays back escrowed amount, failure is logged as critical */
    void refund(const Address &payee,
                const AssetId &asset,
                const TokenAmount &amount);

    /** Puts back channel removed by a failed close */
    void restore(const Channel &channel);

    /** Escrows amount from payer, zero amount moves nothing */
    outcome::result<void> escrowIn(const Address &payer,
                                   const AssetId &asset,
                                   const TokenAmount &amount);

    /** Pays amount out of escrow, zero amount moves nothing */
    outcome::result<void> escrowOut(const Address &payee,
                                    const AssetId &asset,
                                    const TokenAmount &amount);

    Duration min_challenge_period_;
    std::shared_ptr<EscrowLedger> ledger_;
    std::shared_ptr<StateValidator> validator_;
    std::shared_ptr<UTCClock> clock_;

    /** Taken before mutex_, held until the transition event is emitted */
    std::mutex emit_mutex_;
    mutable std::shared_mutex mutex_;
    ChannelRegistry registry_;
    ChannelEvents events_;
    common::Logger logger_;
  };
}  // namespace pc::paych
