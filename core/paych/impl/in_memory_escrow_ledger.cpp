/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "paych/impl/in_memory_escrow_ledger.hpp"

#include "common/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pc::paych, EscrowLedgerError, e) {
  using E = pc::paych::EscrowLedgerError;
  switch (e) {
    case E::kInsufficientFunds:
      return "EscrowLedger: account balance is too low";
    case E::kInsufficientCustody:
      return "EscrowLedger: custody balance is too low";
    case E::kNegativeAmount:
      return "EscrowLedger: amount is negative";
  }
  return "EscrowLedger: unknown error";
}

namespace pc::paych {
  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("escrow");
      return logger;
    }
  }  // namespace

  outcome::result<void> InMemoryEscrowLedger::transferIn(
      const Address &payer, const AssetId &asset, const TokenAmount &amount) {
    if (amount < 0) {
      return EscrowLedgerError::kNegativeAmount;
    }
    std::lock_guard lock{mutex_};
    auto &balance = accounts_[{asset, payer}];
    if (balance < amount) {
      logger()->debug("transferIn {} of {} refused, balance {}",
                      amount.str(),
                      payer.toString(),
                      balance.str());
      return EscrowLedgerError::kInsufficientFunds;
    }
    balance -= amount;
    custody_[asset] += amount;
    return outcome::success();
  }

  outcome::result<void> InMemoryEscrowLedger::transferOut(
      const Address &payee, const AssetId &asset, const TokenAmount &amount) {
    if (amount < 0) {
      return EscrowLedgerError::kNegativeAmount;
    }
    std::lock_guard lock{mutex_};
    auto &held = custody_[asset];
    if (held < amount) {
      logger()->debug("transferOut {} to {} refused, custody {}",
                      amount.str(),
                      payee.toString(),
                      held.str());
      return EscrowLedgerError::kInsufficientCustody;
    }
    held -= amount;
    accounts_[{asset, payee}] += amount;
    return outcome::success();
  }

  outcome::result<void> InMemoryEscrowLedger::credit(
      const Address &account, const AssetId &asset, const TokenAmount &amount) {
    if (amount < 0) {
      return EscrowLedgerError::kNegativeAmount;
    }
    std::lock_guard lock{mutex_};
    accounts_[{asset, account}] += amount;
    return outcome::success();
  }

  TokenAmount InMemoryEscrowLedger::balanceOf(const Address &account,
                                              const AssetId &asset) const {
    std::lock_guard lock{mutex_};
    auto it = accounts_.find({asset, account});
    return it == accounts_.end() ? TokenAmount{0} : it->second;
  }

  TokenAmount InMemoryEscrowLedger::custodyOf(const AssetId &asset) const {
    std::lock_guard lock{mutex_};
    auto it = custody_.find(asset);
    return it == custody_.end() ? TokenAmount{0} : it->second;
  }
}  // namespace pc::paych
