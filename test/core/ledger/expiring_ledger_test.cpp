/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/expiring_ledger.hpp"

#include <gtest/gtest.h>

#include "testutil/address.hpp"
#include "testutil/outcome.hpp"

using exl::ledger::Bucket;
using exl::ledger::ExpiringLedger;
using exl::ledger::LedgerError;
using exl::primitives::kMaxTokenAmount;
using exl::primitives::SlotIndex;
using exl::primitives::Tick;
using exl::primitives::TokenAmount;
using exl::testutil::Address;
using exl::testutil::makeAddress;
using exl::window::makeWindowConfig;
using exl::window::SlidingWindow;
using exl::window::TransferStamping;
using exl::window::WindowConfigError;

/// ticks per slot
constexpr Tick kUnit{10};

/// first tick of slot
constexpr Tick at(SlotIndex slot) {
  return slot * kUnit;
}

class ExpiringLedgerTest : public ::testing::Test {
 public:
  /// 10 ticks per slot, 4 slots per era, batches live for 2 slots
  SlidingWindow window{makeWindowConfig(kUnit, 4, 2).value()};
  ExpiringLedger ledger{window};
  const Address alice{makeAddress(0xa1)};
  const Address bob{makeAddress(0xb0)};

  TokenAmount total(Tick tick) const {
    return ledger.balanceAt(alice, tick) + ledger.balanceAt(bob, tick);
  }
};

/**
 * @given 400 ticks per slot, 4 slots per era, 2 slots window, one unit
 * minted at slot 0 and one at slot 1
 * @when balance is queried in slots 1, 2 and 3
 * @then 2, then 1, then 0
 */
TEST(ExpiringLedgerScenario, WindowOfTwoSlots) {
  SlidingWindow window{makeWindowConfig(400, 4, 2).value()};
  ExpiringLedger ledger{window};
  const auto alice{makeAddress(0xa1)};
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 1, 0));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 1, 400));
  EXPECT_EQ(ledger.balanceAt(alice, 400), 2);
  EXPECT_EQ(ledger.balanceAt(alice, 800), 1);
  EXPECT_EQ(ledger.balanceAt(alice, 1200), 0);
  EXPECT_EQ(ledger.rawBalance(alice), 2);
}

/**
 * @given alice minted 10 in slot 0 and 10 in slot 1, bob 10 twice in slot 1
 * @when alice transfers 5 in slot 1, then window moves, then alice spends
 * the rest
 * @then oldest units leave first and expire on schedule under preserve
 * stamping
 */
TEST_F(ExpiringLedgerTest, TwoAccountsOldestFirst) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 10, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 10, at(1)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(bob, 10, at(1)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(bob, 10, at(1)));
  EXPECT_EQ(ledger.balanceAt(alice, at(1)), 20);
  EXPECT_EQ(ledger.balanceAt(bob, at(1)), 20);

  EXPECT_OUTCOME_TRUE_1(ledger.transfer(alice, bob, 5, at(1)));
  EXPECT_EQ(ledger.balanceAt(alice, at(1)), 15);
  EXPECT_EQ(ledger.balanceAt(bob, at(1)), 25);
  EXPECT_EQ(ledger.listBuckets(alice),
            (std::vector<Bucket>{{0, 5}, {1, 10}}));
  EXPECT_EQ(ledger.listBuckets(bob), (std::vector<Bucket>{{0, 5}, {1, 20}}));

  EXPECT_EQ(ledger.balanceAt(alice, at(2)), 10);
  EXPECT_EQ(ledger.balanceAt(bob, at(2)), 20);

  EXPECT_OUTCOME_TRUE_1(ledger.transfer(alice, bob, 5, at(2)));
  EXPECT_OUTCOME_TRUE_1(ledger.transfer(alice, bob, 5, at(2)));
  EXPECT_EQ(ledger.balanceAt(alice, at(2)), 0);
  EXPECT_EQ(ledger.balanceAt(bob, at(2)), 30);

  EXPECT_EQ(ledger.balanceAt(bob, at(3)), 0);
}

/**
 * @given batch minted at slot k
 * @when balance queried at last tick of slot k + w - 1 and first of k + w
 * @then live, then expired
 */
TEST_F(ExpiringLedgerTest, ExpiryBoundary) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 7, at(5)));
  EXPECT_EQ(ledger.balanceAt(alice, at(7) - 1), 7);
  EXPECT_EQ(ledger.balanceAt(alice, at(7)), 0);
  EXPECT_EQ(ledger.balanceAtSlot(alice, 6), 7);
  EXPECT_EQ(ledger.balanceAtSlot(alice, 7), 0);
}

/**
 * @given balances spread over several slots
 * @when transfers and burns happen
 * @then sum of live balances changes by mints and burns only
 */
TEST_F(ExpiringLedgerTest, Conservation) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 30, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(bob, 12, at(1)));
  const auto before{total(at(1))};
  EXPECT_OUTCOME_TRUE_1(ledger.transfer(alice, bob, 17, at(1)));
  EXPECT_OUTCOME_TRUE_1(ledger.transfer(bob, alice, 20, at(1)));
  EXPECT_EQ(total(at(1)), before);
  EXPECT_OUTCOME_TRUE_1(ledger.burn(bob, 4, at(1)));
  EXPECT_EQ(total(at(1)), TokenAmount{before - 4});
  EXPECT_GE(ledger.balanceAt(alice, at(1)), 0);
  EXPECT_GE(ledger.balanceAt(bob, at(1)), 0);
}

/**
 * @given fresh account
 * @when mint then transfer whole amount away
 * @then sender balance back to zero, receiver gets amount
 */
TEST_F(ExpiringLedgerTest, MintTransferRoundTrip) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 9, at(3)));
  EXPECT_OUTCOME_TRUE_1(ledger.transfer(alice, bob, 9, at(3)));
  EXPECT_EQ(ledger.balanceAt(alice, at(3)), 0);
  EXPECT_EQ(ledger.balanceAt(bob, at(3)), 9);
  EXPECT_TRUE(ledger.listBuckets(alice).empty());
}

/**
 * @given alice holds 10 live and 10 expired units
 * @when transfer or burn of 15
 * @then kInsufficientBalance and no bucket changes
 */
TEST_F(ExpiringLedgerTest, FailedDebitIsAtomic) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 10, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 10, at(2)));
  const auto buckets{ledger.listBuckets(alice)};
  EXPECT_OUTCOME_ERROR(LedgerError::kInsufficientBalance,
                       ledger.transfer(alice, bob, 15, at(2)));
  EXPECT_OUTCOME_ERROR(LedgerError::kInsufficientBalance,
                       ledger.burn(alice, 15, at(2)));
  EXPECT_EQ(ledger.listBuckets(alice), buckets);
  EXPECT_TRUE(ledger.listBuckets(bob).empty());
  EXPECT_EQ(ledger.balanceAt(alice, at(2)), 10);
}

/**
 * @given amounts outside token range
 * @when mint, burn or transfer
 * @then kAmountOverflow
 */
TEST_F(ExpiringLedgerTest, AmountRange) {
  const TokenAmount too_big{kMaxTokenAmount + 1};
  EXPECT_OUTCOME_ERROR(LedgerError::kAmountOverflow,
                       ledger.mint(alice, too_big, at(0)));
  EXPECT_OUTCOME_ERROR(LedgerError::kAmountOverflow,
                       ledger.burn(alice, TokenAmount{-1}, at(0)));
  EXPECT_OUTCOME_ERROR(LedgerError::kAmountOverflow,
                       ledger.transfer(alice, bob, too_big, at(0)));
}

/**
 * @given bob holds max amount in slot 0, alice holds units of slot 0
 * @when alice transfers into bob full bucket
 * @then kAmountOverflow and alice keeps her units
 */
TEST_F(ExpiringLedgerTest, CreditOverflow) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(bob, kMaxTokenAmount, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 1, at(0)));
  EXPECT_OUTCOME_ERROR(LedgerError::kAmountOverflow,
                       ledger.transfer(alice, bob, 1, at(0)));
  EXPECT_EQ(ledger.balanceAt(alice, at(0)), 1);
  EXPECT_EQ(ledger.balanceAt(bob, at(0)), kMaxTokenAmount);
}

/**
 * @given bob holds max amount in slot 0, alice holds 3 units of slot 0
 * @when checkTransfer with overflowing, negative, uncovered and valid amounts
 * @then same errors transfer reports, nothing moved in any case
 */
TEST_F(ExpiringLedgerTest, CheckTransfer) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(bob, kMaxTokenAmount, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 3, at(0)));
  EXPECT_OUTCOME_ERROR(LedgerError::kAmountOverflow,
                       ledger.checkTransfer(alice, bob, 1, at(0)));
  EXPECT_OUTCOME_ERROR(LedgerError::kAmountOverflow,
                       ledger.checkTransfer(alice, bob, -1, at(0)));
  EXPECT_OUTCOME_ERROR(LedgerError::kInsufficientBalance,
                       ledger.checkTransfer(bob, alice, 1, at(2)));
  EXPECT_OUTCOME_TRUE_1(ledger.checkTransfer(alice, alice, 3, at(1)));
  EXPECT_OUTCOME_TRUE_1(ledger.checkTransfer(bob, alice, 1, at(1)));
  EXPECT_EQ(ledger.balanceAt(alice, at(0)), 3);
  EXPECT_EQ(ledger.balanceAt(bob, at(0)), kMaxTokenAmount);
}

/**
 * @given alice and bob hold units of slots 0 and 1
 * @when totalSupply as slots pass
 * @then only live buckets of all accounts count
 */
TEST_F(ExpiringLedgerTest, TotalSupply) {
  EXPECT_EQ(ledger.totalSupply(at(0)), 0);
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 2, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(bob, 5, at(1)));
  EXPECT_EQ(ledger.totalSupply(at(1)), 7);
  EXPECT_EQ(ledger.totalSupply(at(1)), total(at(1)));
  EXPECT_EQ(ledger.totalSupply(at(2)), 5);
  EXPECT_EQ(ledger.totalSupply(at(3)), 0);
}

/**
 * @given alice holds units in two slots
 * @when she transfers to herself
 * @then buckets unchanged
 */
TEST_F(ExpiringLedgerTest, SelfTransfer) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 4, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 6, at(1)));
  const auto buckets{ledger.listBuckets(alice)};
  EXPECT_OUTCOME_TRUE_1(ledger.transfer(alice, alice, 7, at(1)));
  EXPECT_EQ(ledger.listBuckets(alice), buckets);
}

/**
 * @given alice holds units of slots 0 and 1
 * @when transferFromSlot of slot 1 units
 * @then only that bucket moves, keeping its mint slot
 */
TEST_F(ExpiringLedgerTest, TransferFromSlot) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 4, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 6, at(1)));
  EXPECT_OUTCOME_TRUE_1(ledger.transferFromSlot(alice, bob, 1, 5, at(1)));
  EXPECT_EQ(ledger.listBuckets(alice), (std::vector<Bucket>{{0, 4}, {1, 1}}));
  EXPECT_EQ(ledger.listBuckets(bob), (std::vector<Bucket>{{1, 5}}));
}

/**
 * @given alice holds expired units of slot 0 and live units of slot 2
 * @when transferFromSlot of expired slot, or more than slot holds
 * @then kTransferExpired, kInsufficientBalance, nothing moved
 */
TEST_F(ExpiringLedgerTest, TransferFromSlotErrors) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 4, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 6, at(2)));
  EXPECT_OUTCOME_ERROR(LedgerError::kTransferExpired,
                       ledger.transferFromSlot(alice, bob, 0, 1, at(2)));
  EXPECT_OUTCOME_ERROR(LedgerError::kInsufficientBalance,
                       ledger.transferFromSlot(alice, bob, 2, 7, at(2)));
  EXPECT_OUTCOME_ERROR(LedgerError::kInsufficientBalance,
                       ledger.transferFromSlot(alice, bob, 3, 1, at(3)));
  EXPECT_EQ(ledger.rawBalance(alice), 10);
  EXPECT_TRUE(ledger.listBuckets(bob).empty());
}

/**
 * @given restamp policy, alice minted at slot 0
 * @when alice transfers to bob at slot 1
 * @then bob units live until slot 1 + w, unlike preserve policy
 */
TEST_F(ExpiringLedgerTest, StampingPolicies) {
  SlidingWindow restamp_window{
      makeWindowConfig(kUnit, 4, 2, TransferStamping::kRestampCurrentSlot)
          .value()};
  ExpiringLedger restamp{restamp_window};
  for (auto *target : {&ledger, &restamp}) {
    EXPECT_OUTCOME_TRUE_1(target->mint(alice, 8, at(0)));
    EXPECT_OUTCOME_TRUE_1(target->transfer(alice, bob, 8, at(1)));
  }
  EXPECT_EQ(ledger.listBuckets(bob), (std::vector<Bucket>{{0, 8}}));
  EXPECT_EQ(restamp.listBuckets(bob), (std::vector<Bucket>{{1, 8}}));
  EXPECT_EQ(ledger.balanceAt(bob, at(2)), 0);
  EXPECT_EQ(restamp.balanceAt(bob, at(2)), 8);
  EXPECT_EQ(restamp.balanceAt(bob, at(3)), 0);
}

/**
 * @given units minted in slots 0, 1, 2
 * @when balanceAtSlot for slot 1
 * @then units minted after slot 1 are not counted
 */
TEST_F(ExpiringLedgerTest, BalanceAtSlotUpperBound) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 1, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 2, at(1)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 4, at(2)));
  EXPECT_EQ(ledger.balanceAtSlot(alice, 1), 3);
  EXPECT_EQ(ledger.balanceAtSlot(alice, 2), 6);
  EXPECT_EQ(ledger.balanceAt(alice, at(2)), 6);
}

/**
 * @given units in slots 4 and 5, current slot 5
 * @when balanceInFrame for several ranges
 * @then live units of range summed, reversed range is an error
 */
TEST_F(ExpiringLedgerTest, BalanceInFrame) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 1, at(3)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 2, at(4)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 4, at(5)));
  EXPECT_OUTCOME_EQ(ledger.balanceInFrame(alice, 0, 5, at(5)), 6);
  EXPECT_OUTCOME_EQ(ledger.balanceInFrame(alice, 5, 5, at(5)), 4);
  EXPECT_OUTCOME_EQ(ledger.balanceInFrame(alice, 0, 3, at(5)), 0);
  EXPECT_OUTCOME_ERROR(WindowConfigError::kInvalidTimeWindow,
                       ledger.balanceInFrame(alice, 5, 4, at(5)));
}

/**
 * @given units in slots 3 and 4, era is 4 slots
 * @when balanceOfEra at slot 4
 * @then only live units minted inside era counted
 */
TEST_F(ExpiringLedgerTest, BalanceOfEra) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 1, at(3)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 2, at(4)));
  EXPECT_EQ(ledger.balanceOfEra(alice, 0, at(4)), 1);
  EXPECT_EQ(ledger.balanceOfEra(alice, 1, at(4)), 2);
  EXPECT_EQ(ledger.balanceOfEra(alice, 0, at(5)), 0);
  EXPECT_EQ(ledger.balanceOfEra(alice, 2, at(5)), 0);
}

/**
 * @given units in slot 2
 * @when bucketBalance before and after expiry
 * @then bucket amount, then zero though raw balance remains
 */
TEST_F(ExpiringLedgerTest, BucketBalance) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 3, at(2)));
  EXPECT_EQ(ledger.bucketBalance(alice, 2, at(3)), 3);
  EXPECT_EQ(ledger.bucketBalance(alice, 1, at(3)), 0);
  EXPECT_EQ(ledger.bucketBalance(alice, 2, at(4)), 0);
  EXPECT_EQ(ledger.rawBalance(alice), 3);
}

/**
 * @given expired and live units
 * @when prune
 * @then expired buckets dropped, live balances unchanged
 */
TEST_F(ExpiringLedgerTest, PruneKeepsBalances) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 1, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 2, at(1)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(bob, 4, at(0)));
  EXPECT_OUTCOME_TRUE_1(ledger.mint(bob, 8, at(2)));
  const auto alice_before{ledger.balanceAt(alice, at(2))};
  const auto bob_before{ledger.balanceAt(bob, at(2))};
  EXPECT_EQ(ledger.prune(at(2)), 2);
  EXPECT_EQ(ledger.balanceAt(alice, at(2)), alice_before);
  EXPECT_EQ(ledger.balanceAt(bob, at(2)), bob_before);
  EXPECT_EQ(ledger.rawBalance(bob), 8);
  EXPECT_EQ(ledger.prune(at(2)), 0);
}

/**
 * @given some state
 * @when same query repeated
 * @then same answer and no state change
 */
TEST_F(ExpiringLedgerTest, QueriesIdempotent) {
  EXPECT_OUTCOME_TRUE_1(ledger.mint(alice, 5, at(1)));
  const auto buckets{ledger.listBuckets(alice)};
  EXPECT_EQ(ledger.balanceAt(alice, at(2)), ledger.balanceAt(alice, at(2)));
  EXPECT_EQ(ledger.balanceAt(alice, at(9)), 0);
  EXPECT_EQ(ledger.balanceAt(alice, at(2)), 5);
  EXPECT_EQ(ledger.listBuckets(alice), buckets);
}
