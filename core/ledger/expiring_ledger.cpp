/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/expiring_ledger.hpp"

#include <algorithm>
#include <limits>
#include <mutex>

#include "common/logger.hpp"

namespace exl::ledger {
  using primitives::isValidAmount;
  using window::TransferStamping;
  using window::WindowConfigError;

  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("ledger");
      return logger;
    }

    constexpr auto kMaxSlot{std::numeric_limits<SlotIndex>::max()};
  }  // namespace

  ExpiringLedger::ExpiringLedger(const SlidingWindow &window)
      : window_{window} {}

  const SlidingWindow &ExpiringLedger::window() const {
    return window_;
  }

  outcome::result<void> ExpiringLedger::mint(const Address &account,
                                             const TokenAmount &amount,
                                             Tick tick) {
    std::unique_lock lock{mutex_};
    const auto slot{window_.slotAt(tick)};
    OUTCOME_TRY(buckets_.recordMint(account, amount, slot));
    logger()->debug(
        "mint {} to {} at slot {}", amount.str(), account.toHex(), slot);
    return outcome::success();
  }

  outcome::result<void> ExpiringLedger::burn(const Address &account,
                                             const TokenAmount &amount,
                                             Tick tick) {
    if (!isValidAmount(amount)) {
      return LedgerError::kAmountOverflow;
    }
    std::unique_lock lock{mutex_};
    const auto current_slot{window_.slotAt(tick)};
    OUTCOME_TRY(plan, planDebit(account, amount, current_slot));
    for (const auto &bucket : plan) {
      OUTCOME_TRY(
          buckets_.removeOrDecrement(account, bucket.slot, bucket.amount));
    }
    logger()->debug("burn {} from {} at slot {}",
                    amount.str(),
                    account.toHex(),
                    current_slot);
    return outcome::success();
  }

  outcome::result<void> ExpiringLedger::transfer(const Address &from,
                                                 const Address &to,
                                                 const TokenAmount &amount,
                                                 Tick tick) {
    std::unique_lock lock{mutex_};
    const auto current_slot{window_.slotAt(tick)};
    OUTCOME_TRY(plan, planTransfer(from, to, amount, current_slot));
    OUTCOME_TRY(move(from, to, plan, current_slot));
    logger()->debug("transfer {} from {} to {} at slot {}",
                    amount.str(),
                    from.toHex(),
                    to.toHex(),
                    current_slot);
    return outcome::success();
  }

  outcome::result<void> ExpiringLedger::checkTransfer(const Address &from,
                                                      const Address &to,
                                                      const TokenAmount &amount,
                                                      Tick tick) const {
    std::shared_lock lock{mutex_};
    OUTCOME_TRY(planTransfer(from, to, amount, window_.slotAt(tick)));
    return outcome::success();
  }

  outcome::result<void> ExpiringLedger::transferFromSlot(
      const Address &from,
      const Address &to,
      SlotIndex mint_slot,
      const TokenAmount &amount,
      Tick tick) {
    if (!isValidAmount(amount)) {
      return LedgerError::kAmountOverflow;
    }
    std::unique_lock lock{mutex_};
    const auto current_slot{window_.slotAt(tick)};
    if (window_.isExpiredAtSlot(mint_slot, current_slot)) {
      logger()->warn("transfer of expired bucket {} from {} at slot {}",
                     mint_slot,
                     from.toHex(),
                     current_slot);
      return LedgerError::kTransferExpired;
    }
    const auto available{buckets_.bucketAmount(from, mint_slot)};
    if (available < amount) {
      logger()->warn("insufficient bucket {} of {}: available {}, requested {}",
                     mint_slot,
                     from.toHex(),
                     available.str(),
                     amount.str());
      return LedgerError::kInsufficientBalance;
    }
    DebitPlan plan;
    if (amount != 0) {
      plan.push_back(Bucket{mint_slot, amount});
    }
    OUTCOME_TRY(checkCredit(from, to, plan, current_slot));
    OUTCOME_TRY(move(from, to, plan, current_slot));
    logger()->debug("transfer {} of bucket {} from {} to {}",
                    amount.str(),
                    mint_slot,
                    from.toHex(),
                    to.toHex());
    return outcome::success();
  }

  TokenAmount ExpiringLedger::balanceAt(const Address &account,
                                        Tick tick) const {
    std::shared_lock lock{mutex_};
    return liveSum(
        account, window_.oldestLiveSlot(window_.slotAt(tick)), kMaxSlot);
  }

  TokenAmount ExpiringLedger::balanceAtSlot(const Address &account,
                                            SlotIndex slot) const {
    std::shared_lock lock{mutex_};
    return liveSum(account, window_.oldestLiveSlot(slot), slot);
  }

  outcome::result<TokenAmount> ExpiringLedger::balanceInFrame(
      const Address &account, SlotIndex from, SlotIndex to, Tick tick) const {
    if (from > to) {
      return WindowConfigError::kInvalidTimeWindow;
    }
    std::shared_lock lock{mutex_};
    const auto oldest{window_.oldestLiveSlot(window_.slotAt(tick))};
    return liveSum(account, std::max(from, oldest), to);
  }

  TokenAmount ExpiringLedger::balanceOfEra(const Address &account,
                                           Era era,
                                           Tick tick) const {
    const auto first{window_.eraStart(era)};
    const auto slots_per_era{window_.config().slots_per_era};
    const auto last{first > kMaxSlot - (slots_per_era - 1)
                        ? kMaxSlot
                        : first + (slots_per_era - 1)};
    std::shared_lock lock{mutex_};
    const auto oldest{window_.oldestLiveSlot(window_.slotAt(tick))};
    return liveSum(account, std::max(first, oldest), last);
  }

  TokenAmount ExpiringLedger::bucketBalance(const Address &account,
                                            SlotIndex mint_slot,
                                            Tick tick) const {
    if (window_.isExpired(mint_slot, tick)) {
      return 0;
    }
    std::shared_lock lock{mutex_};
    return buckets_.bucketAmount(account, mint_slot);
  }

  TokenAmount ExpiringLedger::rawBalance(const Address &account) const {
    std::shared_lock lock{mutex_};
    return buckets_.rawBalance(account);
  }

  std::vector<Bucket> ExpiringLedger::listBuckets(
      const Address &account) const {
    std::shared_lock lock{mutex_};
    return buckets_.listBuckets(account);
  }

  TokenAmount ExpiringLedger::totalSupply(Tick tick) const {
    std::shared_lock lock{mutex_};
    return buckets_.totalFrom(window_.oldestLiveSlot(window_.slotAt(tick)));
  }

  size_t ExpiringLedger::prune(Tick tick) {
    std::unique_lock lock{mutex_};
    const auto oldest{window_.oldestLiveSlot(window_.slotAt(tick))};
    const auto erased{buckets_.pruneAll(oldest)};
    logger()->debug("pruned {} buckets older than slot {}", erased, oldest);
    return erased;
  }

  TokenAmount ExpiringLedger::liveSum(const Address &account,
                                      SlotIndex from,
                                      SlotIndex to) const {
    TokenAmount total{0};
    if (from > to) {
      return total;
    }
    const auto *buckets{buckets_.buckets(account)};
    if (!buckets) {
      return total;
    }
    for (auto it{buckets->lower_bound(from)};
         it != buckets->end() && it->first <= to;
         ++it) {
      total += it->second;
    }
    return total;
  }

  outcome::result<ExpiringLedger::DebitPlan> ExpiringLedger::planTransfer(
      const Address &from,
      const Address &to,
      const TokenAmount &amount,
      SlotIndex current_slot) const {
    if (!isValidAmount(amount)) {
      return LedgerError::kAmountOverflow;
    }
    OUTCOME_TRY(plan, planDebit(from, amount, current_slot));
    OUTCOME_TRY(checkCredit(from, to, plan, current_slot));
    return plan;
  }

  outcome::result<ExpiringLedger::DebitPlan> ExpiringLedger::planDebit(
      const Address &account,
      const TokenAmount &amount,
      SlotIndex current_slot) const {
    DebitPlan plan;
    TokenAmount remaining{amount};
    if (const auto *buckets{buckets_.buckets(account)}) {
      for (auto it{buckets->lower_bound(window_.oldestLiveSlot(current_slot))};
           it != buckets->end() && remaining > 0;
           ++it) {
        TokenAmount take{std::min(remaining, it->second)};
        remaining -= take;
        plan.push_back(Bucket{it->first, std::move(take)});
      }
    }
    if (remaining > 0) {
      logger()->warn("insufficient balance of {}: available {}, requested {}",
                     account.toHex(),
                     TokenAmount{amount - remaining}.str(),
                     amount.str());
      return LedgerError::kInsufficientBalance;
    }
    return plan;
  }

  outcome::result<void> ExpiringLedger::checkCredit(
      const Address &from,
      const Address &to,
      const DebitPlan &plan,
      SlotIndex current_slot) const {
    const auto restamp{window_.config().stamping
                       == TransferStamping::kRestampCurrentSlot};
    std::map<SlotIndex, TokenAmount> resulting;
    for (const auto &bucket : plan) {
      const auto target{restamp ? current_slot : bucket.slot};
      auto it{resulting.find(target)};
      if (it == resulting.end()) {
        it = resulting.emplace(target, buckets_.bucketAmount(to, target)).first;
      }
      it->second += bucket.amount;
    }
    if (from == to) {
      for (const auto &bucket : plan) {
        auto it{resulting.find(bucket.slot)};
        if (it != resulting.end()) {
          it->second -= bucket.amount;
        }
      }
    }
    for (const auto &[slot, amount] : resulting) {
      if (!isValidAmount(amount)) {
        logger()->warn("bucket {} of {} would overflow", slot, to.toHex());
        return LedgerError::kAmountOverflow;
      }
    }
    return outcome::success();
  }

  outcome::result<void> ExpiringLedger::move(const Address &from,
                                             const Address &to,
                                             const DebitPlan &plan,
                                             SlotIndex current_slot) {
    const auto restamp{window_.config().stamping
                       == TransferStamping::kRestampCurrentSlot};
    for (const auto &bucket : plan) {
      OUTCOME_TRY(buckets_.removeOrDecrement(from, bucket.slot, bucket.amount));
    }
    for (const auto &bucket : plan) {
      OUTCOME_TRY(buckets_.recordMint(
          to, bucket.amount, restamp ? current_slot : bucket.slot));
    }
    return outcome::success();
  }
}  // namespace exl::ledger
