/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/expirable_token.hpp"

#include "common/logger.hpp"

namespace exl::token {
  using primitives::address::kZeroAddress;

  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("token");
      return logger;
    }
  }  // namespace

  ExpirableToken::ExpirableToken(std::string name,
                                 std::string symbol,
                                 std::shared_ptr<TickClock> clock,
                                 const SlidingWindow &window,
                                 std::shared_ptr<AllowanceGate> allowances)
      : name_{std::move(name)},
        symbol_{std::move(symbol)},
        clock_{std::move(clock)},
        ledger_{window},
        allowances_{std::move(allowances)} {}

  const std::string &ExpirableToken::name() const {
    return name_;
  }

  const std::string &ExpirableToken::symbol() const {
    return symbol_;
  }

  uint8_t ExpirableToken::decimals() const {
    return kDefaultDecimals;
  }

  outcome::result<void> ExpirableToken::mint(const Address &account,
                                             const TokenAmount &amount) {
    if (account.isZero()) {
      return TokenError::kInvalidReceiver;
    }
    {
      std::lock_guard lock{mutex_};
      OUTCOME_TRY(tick, clock_->currentTick());
      OUTCOME_TRY(ledger_.mint(account, amount, tick));
    }
    emit(kZeroAddress, account, amount);
    return outcome::success();
  }

  outcome::result<void> ExpirableToken::burn(const Address &account,
                                             const TokenAmount &amount) {
    if (account.isZero()) {
      return TokenError::kInvalidSender;
    }
    {
      std::lock_guard lock{mutex_};
      OUTCOME_TRY(tick, clock_->currentTick());
      OUTCOME_TRY(ledger_.burn(account, amount, tick));
    }
    emit(account, kZeroAddress, amount);
    return outcome::success();
  }

  outcome::result<void> ExpirableToken::transfer(const Address &from,
                                                 const Address &to,
                                                 const TokenAmount &amount) {
    if (from.isZero()) {
      return TokenError::kInvalidSender;
    }
    if (to.isZero()) {
      return TokenError::kInvalidReceiver;
    }
    {
      std::lock_guard lock{mutex_};
      OUTCOME_TRY(tick, clock_->currentTick());
      OUTCOME_TRY(ledger_.transfer(from, to, amount, tick));
    }
    emit(from, to, amount);
    return outcome::success();
  }

  outcome::result<void> ExpirableToken::transferAtSlot(
      const Address &from,
      const Address &to,
      SlotIndex mint_slot,
      const TokenAmount &amount) {
    if (from.isZero()) {
      return TokenError::kInvalidSender;
    }
    if (to.isZero()) {
      return TokenError::kInvalidReceiver;
    }
    {
      std::lock_guard lock{mutex_};
      OUTCOME_TRY(tick, clock_->currentTick());
      OUTCOME_TRY(ledger_.transferFromSlot(from, to, mint_slot, amount, tick));
    }
    emit(from, to, amount);
    return outcome::success();
  }

  outcome::result<void> ExpirableToken::transferFrom(
      const Address &spender,
      const Address &from,
      const Address &to,
      const TokenAmount &amount) {
    if (from.isZero()) {
      return TokenError::kInvalidSender;
    }
    if (to.isZero()) {
      return TokenError::kInvalidReceiver;
    }
    if (!allowances_) {
      return TokenError::kAllowanceUnavailable;
    }
    {
      std::lock_guard lock{mutex_};
      OUTCOME_TRY(tick, clock_->currentTick());
      auto checked{ledger_.checkTransfer(from, to, amount, tick)};
      if (!checked) {
        logger()->warn("transferFrom by {} of {} from {} rejected: {}",
                       spender.toHex(),
                       amount.str(),
                       from.toHex(),
                       checked.error().message());
        return checked.error();
      }
      OUTCOME_TRY(allowances_->spendAllowance(from, spender, amount));
      OUTCOME_TRY(ledger_.transfer(from, to, amount, tick));
    }
    emit(from, to, amount);
    return outcome::success();
  }

  outcome::result<TokenAmount> ExpirableToken::totalSupply() const {
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.totalSupply(tick);
  }

  ExpiryType ExpirableToken::expiryType() const {
    return clock_->expiryType();
  }

  outcome::result<TokenAmount> ExpirableToken::balanceOf(
      const Address &account) const {
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.balanceAt(account, tick);
  }

  TokenAmount ExpirableToken::balanceOfAtSlot(const Address &account,
                                              SlotIndex slot) const {
    return ledger_.balanceAtSlot(account, slot);
  }

  outcome::result<TokenAmount> ExpirableToken::balanceOfAtEpoch(
      Era era, const Address &account) const {
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.balanceOfEra(account, era, tick);
  }

  outcome::result<TokenAmount> ExpirableToken::bucketBalanceOf(
      const Address &account, SlotIndex mint_slot) const {
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.bucketBalance(account, mint_slot, tick);
  }

  TokenAmount ExpirableToken::rawBalanceOf(const Address &account) const {
    return ledger_.rawBalance(account);
  }

  outcome::result<EraAndSlot> ExpirableToken::currentEraAndSlot() const {
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.window().currentEraAndSlot(tick);
  }

  outcome::result<Era> ExpirableToken::currentEpoch() const {
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.window().eraAt(tick);
  }

  outcome::result<Frame> ExpirableToken::frame() const {
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.window().frame(tick);
  }

  outcome::result<bool> ExpirableToken::isSlotExpired(
      SlotIndex mint_slot) const {
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.window().isExpired(mint_slot, tick);
  }

  Tick ExpirableToken::epochLength() const {
    return ledger_.window().ticksPerEra();
  }

  uint64_t ExpirableToken::validityDuration() const {
    return ledger_.window().config().validity_window_slots;
  }

  Tick ExpirableToken::validityPeriod() const {
    return ledger_.window().validityPeriod();
  }

  outcome::result<size_t> ExpirableToken::prune() {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(tick, clock_->currentTick());
    return ledger_.prune(tick);
  }

  const ExpiringLedger &ExpirableToken::ledger() const {
    return ledger_;
  }

  ExpirableToken::Connection ExpirableToken::subscribe(
      const std::function<TransferSubscriber> &subscriber) {
    return transfer_signal_.connect(subscriber);
  }

  void ExpirableToken::emit(const Address &from,
                            const Address &to,
                            const TokenAmount &value) {
    transfer_signal_(TransferEvent{from, to, value});
  }
}  // namespace exl::token
