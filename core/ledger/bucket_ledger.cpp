/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/bucket_ledger.hpp"

#include <iterator>

#include "common/logger.hpp"

namespace exl::ledger {
  using primitives::isValidAmount;

  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("ledger");
      return logger;
    }
  }  // namespace

  outcome::result<void> BucketLedger::recordMint(const Address &account,
                                                 const TokenAmount &amount,
                                                 SlotIndex mint_slot) {
    if (!isValidAmount(amount)) {
      return LedgerError::kAmountOverflow;
    }
    if (amount == 0) {
      return outcome::success();
    }
    auto &buckets{accounts_[account]};
    auto it{buckets.find(mint_slot)};
    if (it == buckets.end()) {
      buckets.emplace(mint_slot, amount);
      return outcome::success();
    }
    TokenAmount merged{it->second + amount};
    if (!isValidAmount(merged)) {
      return LedgerError::kAmountOverflow;
    }
    it->second = std::move(merged);
    return outcome::success();
  }

  std::vector<Bucket> BucketLedger::listBuckets(const Address &account) const {
    std::vector<Bucket> result;
    if (const auto *buckets{this->buckets(account)}) {
      result.reserve(buckets->size());
      for (const auto &[slot, amount] : *buckets) {
        result.push_back(Bucket{slot, amount});
      }
    }
    return result;
  }

  const AccountBuckets *BucketLedger::buckets(const Address &account) const {
    auto it{accounts_.find(account)};
    if (it == accounts_.end()) {
      return nullptr;
    }
    return &it->second;
  }

  outcome::result<void> BucketLedger::removeOrDecrement(
      const Address &account, SlotIndex mint_slot, const TokenAmount &amount) {
    auto account_it{accounts_.find(account)};
    if (account_it == accounts_.end()) {
      logger()->error("no buckets for {}, requested {} from slot {}",
                      account.toHex(),
                      amount.str(),
                      mint_slot);
      return LedgerError::kInsufficientBucketAmount;
    }
    auto &buckets{account_it->second};
    auto it{buckets.find(mint_slot)};
    if (it == buckets.end() || it->second < amount) {
      logger()->error("bucket {} of {} holds {}, requested {}",
                      mint_slot,
                      account.toHex(),
                      it == buckets.end() ? "nothing" : it->second.str(),
                      amount.str());
      return LedgerError::kInsufficientBucketAmount;
    }
    it->second -= amount;
    if (it->second == 0) {
      buckets.erase(it);
      if (buckets.empty()) {
        accounts_.erase(account_it);
      }
    }
    return outcome::success();
  }

  TokenAmount BucketLedger::rawBalance(const Address &account) const {
    TokenAmount total{0};
    if (const auto *buckets{this->buckets(account)}) {
      for (const auto &bucket : *buckets) {
        total += bucket.second;
      }
    }
    return total;
  }

  TokenAmount BucketLedger::bucketAmount(const Address &account,
                                         SlotIndex mint_slot) const {
    if (const auto *buckets{this->buckets(account)}) {
      auto it{buckets->find(mint_slot)};
      if (it != buckets->end()) {
        return it->second;
      }
    }
    return 0;
  }

  size_t BucketLedger::prune(const Address &account,
                             SlotIndex oldest_live_slot) {
    auto account_it{accounts_.find(account)};
    if (account_it == accounts_.end()) {
      return 0;
    }
    auto &buckets{account_it->second};
    const auto end{buckets.lower_bound(oldest_live_slot)};
    const auto erased{
        static_cast<size_t>(std::distance(buckets.begin(), end))};
    buckets.erase(buckets.begin(), end);
    if (buckets.empty()) {
      accounts_.erase(account_it);
    }
    return erased;
  }

  size_t BucketLedger::pruneAll(SlotIndex oldest_live_slot) {
    size_t erased{0};
    for (auto it{accounts_.begin()}; it != accounts_.end();) {
      auto &buckets{it->second};
      const auto end{buckets.lower_bound(oldest_live_slot)};
      erased += static_cast<size_t>(std::distance(buckets.begin(), end));
      buckets.erase(buckets.begin(), end);
      if (buckets.empty()) {
        it = accounts_.erase(it);
      } else {
        ++it;
      }
    }
    return erased;
  }

  size_t BucketLedger::accountCount() const {
    return accounts_.size();
  }

  TokenAmount BucketLedger::totalFrom(SlotIndex from_slot) const {
    TokenAmount total{0};
    for (const auto &[account, buckets] : accounts_) {
      for (auto it{buckets.lower_bound(from_slot)}; it != buckets.end(); ++it) {
        total += it->second;
      }
    }
    return total;
  }
}  // namespace exl::ledger
