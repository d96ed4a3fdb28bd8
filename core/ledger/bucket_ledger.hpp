/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <unordered_map>
#include <vector>

#include "common/cmp.hpp"
#include "ledger/ledger_error.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace exl::ledger {
  using primitives::SlotIndex;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * Amount an account holds from one mint slot
   */
  struct Bucket {
    SlotIndex slot{};
    TokenAmount amount{};

    bool operator==(const Bucket &other) const {
      return slot == other.slot && amount == other.amount;
    }
  };
  EXL_OPERATOR_NOT_EQUAL(Bucket)

  /// mint slot -> amount, ordered oldest first
  using AccountBuckets = std::map<SlotIndex, TokenAmount>;

  /**
   * Raw per-account bucket storage. Knows nothing about expiry and is not
   * synchronized, owner serializes access.
   */
  class BucketLedger {
   public:
    /**
     * Merges amount into bucket of mint slot. Zero amount is ignored.
     * @return kAmountOverflow if amount or resulting bucket leaves token range
     */
    outcome::result<void> recordMint(const Address &account,
                                     const TokenAmount &amount,
                                     SlotIndex mint_slot);

    /**
     * Copy of account buckets, oldest first
     */
    std::vector<Bucket> listBuckets(const Address &account) const;

    /**
     * Live view of account buckets, nullptr if account holds nothing.
     * Invalidated by any mutation.
     */
    const AccountBuckets *buckets(const Address &account) const;

    /**
     * Takes amount from one bucket, erases bucket when it becomes empty
     * @return kInsufficientBucketAmount if bucket is missing or too small
     */
    outcome::result<void> removeOrDecrement(const Address &account,
                                            SlotIndex mint_slot,
                                            const TokenAmount &amount);

    /// sum of all buckets, expired ones included
    TokenAmount rawBalance(const Address &account) const;

    TokenAmount bucketAmount(const Address &account, SlotIndex mint_slot) const;

    /**
     * Erases account buckets minted before oldest_live_slot
     * @return number of erased buckets
     */
    size_t prune(const Address &account, SlotIndex oldest_live_slot);

    size_t pruneAll(SlotIndex oldest_live_slot);

    size_t accountCount() const;

    /// sum of buckets of all accounts minted at or after from_slot
    TokenAmount totalFrom(SlotIndex from_slot) const;

   private:
    std::unordered_map<Address, AccountBuckets> accounts_;
  };
}  // namespace exl::ledger
