/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/signals2.hpp>
#include <memory>
#include <mutex>
#include <string>

#include "clock/tick_clock.hpp"
#include "ledger/expiring_ledger.hpp"
#include "token/allowance_gate.hpp"
#include "token/token_error.hpp"

namespace exl::token {
  using clock::ExpiryType;
  using clock::TickClock;
  using ledger::ExpiringLedger;
  using primitives::Era;
  using primitives::SlotIndex;
  using primitives::Tick;
  using window::EraAndSlot;
  using window::Frame;
  using window::SlidingWindow;

  constexpr uint8_t kDefaultDecimals{18};

  /**
   * Emitted for every successful balance change. Mint comes from zero address,
   * burn goes to zero address.
   */
  struct TransferEvent {
    Address from;
    Address to;
    TokenAmount value;
  };

  /**
   * Fungible token whose units expire after a fixed number of slots, the
   * ERC-7818 shape on top of ExpiringLedger. Reads the time source once per
   * call.
   */
  class ExpirableToken {
   public:
    using TransferSubscriber = void(const TransferEvent &);
    using Connection = boost::signals2::connection;

    ExpirableToken(std::string name,
                   std::string symbol,
                   std::shared_ptr<TickClock> clock,
                   const SlidingWindow &window,
                   std::shared_ptr<AllowanceGate> allowances = nullptr);

    const std::string &name() const;
    const std::string &symbol() const;
    uint8_t decimals() const;

    outcome::result<void> mint(const Address &account,
                               const TokenAmount &amount);

    outcome::result<void> burn(const Address &account,
                               const TokenAmount &amount);

    outcome::result<void> transfer(const Address &from,
                                   const Address &to,
                                   const TokenAmount &amount);

    /**
     * Transfers units of one mint slot, see
     * ExpiringLedger::transferFromSlot
     */
    outcome::result<void> transferAtSlot(const Address &from,
                                         const Address &to,
                                         SlotIndex mint_slot,
                                         const TokenAmount &amount);

    /**
     * Spender moves owner funds. Every ledger check of the transfer runs
     * before allowance is consumed, so a transfer that cannot happen does not
     * eat allowance. Gate is called without the ledger lock and may call back
     * into this token from the same thread.
     */
    outcome::result<void> transferFrom(const Address &spender,
                                       const Address &from,
                                       const Address &to,
                                       const TokenAmount &amount);

    /// spendable units of all accounts, zero for a fresh token
    outcome::result<TokenAmount> totalSupply() const;

    /// whether expiry counts blocks or time, follows the clock
    ExpiryType expiryType() const;

    outcome::result<TokenAmount> balanceOf(const Address &account) const;

    TokenAmount balanceOfAtSlot(const Address &account, SlotIndex slot) const;

    outcome::result<TokenAmount> balanceOfAtEpoch(Era era,
                                                  const Address &account) const;

    outcome::result<TokenAmount> bucketBalanceOf(const Address &account,
                                                 SlotIndex mint_slot) const;

    TokenAmount rawBalanceOf(const Address &account) const;

    outcome::result<EraAndSlot> currentEraAndSlot() const;

    outcome::result<Era> currentEpoch() const;

    outcome::result<Frame> frame() const;

    outcome::result<bool> isSlotExpired(SlotIndex mint_slot) const;

    /// ticks per era
    Tick epochLength() const;

    /// validity window in slots
    uint64_t validityDuration() const;

    /// validity window in ticks
    Tick validityPeriod() const;

    /**
     * Drops expired buckets, balances are not affected
     */
    outcome::result<size_t> prune();

    const ExpiringLedger &ledger() const;

    Connection subscribe(const std::function<TransferSubscriber> &subscriber);

   private:
    void emit(const Address &from, const Address &to, const TokenAmount &value);

    std::string name_;
    std::string symbol_;
    std::shared_ptr<TickClock> clock_;
    ExpiringLedger ledger_;
    std::shared_ptr<AllowanceGate> allowances_;
    boost::signals2::signal<TransferSubscriber> transfer_signal_;
    /// keeps allowance check and debit of transferFrom together, gate may
    /// reenter
    std::recursive_mutex mutex_;
  };
}  // namespace exl::token
