/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <shared_mutex>

#include "ledger/bucket_ledger.hpp"
#include "window/sliding_window.hpp"

namespace exl::ledger {
  using primitives::Era;
  using primitives::Tick;
  using window::SlidingWindow;

  /**
   * Balance ledger whose minted batches stop being spendable once their slot
   * leaves the validity window. Expiry is evaluated on read, nothing is swept
   * unless prune is called.
   *
   * Every mutation runs under exclusive lock and either applies completely or
   * leaves the ledger untouched. Queries share the lock.
   */
  class ExpiringLedger {
   public:
    explicit ExpiringLedger(const SlidingWindow &window);

    const SlidingWindow &window() const;

    /**
     * Credits amount to account in the bucket of the slot of tick
     */
    outcome::result<void> mint(const Address &account,
                               const TokenAmount &amount,
                               Tick tick);

    /**
     * Debits amount from live buckets, oldest first
     * @return kInsufficientBalance if live balance is smaller than amount
     */
    outcome::result<void> burn(const Address &account,
                               const TokenAmount &amount,
                               Tick tick);

    /**
     * Debits sender oldest first and credits receiver according to transfer
     * stamping of the window config
     */
    outcome::result<void> transfer(const Address &from,
                                   const Address &to,
                                   const TokenAmount &amount,
                                   Tick tick);

    /**
     * Runs every check of transfer without mutating the ledger
     * @return error transfer with the same arguments would fail with now
     */
    outcome::result<void> checkTransfer(const Address &from,
                                        const Address &to,
                                        const TokenAmount &amount,
                                        Tick tick) const;

    /**
     * Moves amount out of one specific bucket of sender
     * @return kTransferExpired if bucket is expired at tick,
     * kInsufficientBalance if bucket holds less than amount
     */
    outcome::result<void> transferFromSlot(const Address &from,
                                           const Address &to,
                                           SlotIndex mint_slot,
                                           const TokenAmount &amount,
                                           Tick tick);

    /// spendable balance at tick
    TokenAmount balanceAt(const Address &account, Tick tick) const;

    /**
     * Balance as it was at slot: buckets minted after slot are ignored and
     * expiry is evaluated relative to slot
     */
    TokenAmount balanceAtSlot(const Address &account, SlotIndex slot) const;

    /**
     * Spendable balance of buckets minted within [from, to]
     * @return kInvalidTimeWindow if from > to
     */
    outcome::result<TokenAmount> balanceInFrame(const Address &account,
                                                SlotIndex from,
                                                SlotIndex to,
                                                Tick tick) const;

    /// spendable balance of buckets minted within era
    TokenAmount balanceOfEra(const Address &account, Era era, Tick tick) const;

    /// amount of one bucket, zero once expired
    TokenAmount bucketBalance(const Address &account,
                              SlotIndex mint_slot,
                              Tick tick) const;

    /// all buckets including expired ones
    TokenAmount rawBalance(const Address &account) const;

    std::vector<Bucket> listBuckets(const Address &account) const;

    /// spendable balance of all accounts at tick
    TokenAmount totalSupply(Tick tick) const;

    /**
     * Drops buckets expired at tick
     * @return number of dropped buckets
     */
    size_t prune(Tick tick);

   private:
    using DebitPlan = std::vector<Bucket>;

    /// caller holds lock
    TokenAmount liveSum(const Address &account,
                        SlotIndex from,
                        SlotIndex to) const;

    /// caller holds lock, amount range, debit and credit checks
    outcome::result<DebitPlan> planTransfer(const Address &from,
                                            const Address &to,
                                            const TokenAmount &amount,
                                            SlotIndex current_slot) const;

    /// caller holds lock, no mutation
    outcome::result<DebitPlan> planDebit(const Address &account,
                                         const TokenAmount &amount,
                                         SlotIndex current_slot) const;

    /// caller holds lock, receiver buckets after the move stay in range
    outcome::result<void> checkCredit(const Address &from,
                                      const Address &to,
                                      const DebitPlan &plan,
                                      SlotIndex current_slot) const;

    /// caller holds lock, plan and credit were checked
    outcome::result<void> move(const Address &from,
                               const Address &to,
                               const DebitPlan &plan,
                               SlotIndex current_slot);

    SlidingWindow window_;
    BucketLedger buckets_;
    mutable std::shared_mutex mutex_;
  };
}  // namespace exl::ledger
