/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utility>

#include "common/cmp.hpp"
#include "window/window_config.hpp"

namespace exl::window {
  using primitives::Era;
  using primitives::SlotInEra;
  using primitives::SlotIndex;

  /**
   * Display form of a slot index
   */
  struct EraAndSlot {
    Era era{};
    SlotInEra slot{};

    bool operator==(const EraAndSlot &other) const {
      return era == other.era && slot == other.slot;
    }
  };
  EXL_OPERATOR_NOT_EQUAL(EraAndSlot)

  /**
   * Inclusive range of slots whose batches are still spendable
   */
  struct Frame {
    SlotIndex from{};
    SlotIndex to{};

    bool contains(SlotIndex slot) const {
      return from <= slot && slot <= to;
    }

    bool operator==(const Frame &other) const {
      return from == other.from && to == other.to;
    }
  };
  EXL_OPERATOR_NOT_EQUAL(Frame)

  /**
   * Converts ticks into slot coordinates and decides expiry. Pure, holds only
   * the validated config.
   */
  class SlidingWindow {
   public:
    explicit SlidingWindow(const WindowConfig &config);

    /**
     * Validates config before use, see makeWindowConfig
     */
    static outcome::result<SlidingWindow> create(const WindowConfig &config);

    const WindowConfig &config() const;

    SlotIndex slotAt(Tick tick) const;

    /**
     * First slot at which batch minted in mint_slot is no longer spendable.
     * Saturates at max slot index.
     */
    SlotIndex expirySlot(SlotIndex mint_slot) const;

    bool isExpired(SlotIndex mint_slot, Tick tick) const;

    bool isExpiredAtSlot(SlotIndex mint_slot, SlotIndex slot) const;

    /**
     * Oldest mint slot still live at given slot, saturates at zero
     */
    SlotIndex oldestLiveSlot(SlotIndex slot) const;

    EraAndSlot eraAndSlot(SlotIndex slot) const;

    EraAndSlot currentEraAndSlot(Tick tick) const;

    Era eraAt(Tick tick) const;

    /// first slot index of era
    SlotIndex eraStart(Era era) const;

    Frame frame(Tick tick) const;

    Frame frameAtSlot(SlotIndex slot) const;

    /// frame bounds as {from, to} era and slot pairs
    std::pair<EraAndSlot, EraAndSlot> frameInEraAndSlot(Tick tick) const;

    /// validity window length in ticks
    Tick validityPeriod() const;

    Tick ticksPerSlot() const;

    Tick ticksPerEra() const;

    /**
     * Validity window split into whole eras and remaining slots. A window not
     * longer than one era is reported as {0, window}.
     */
    EraAndSlot frameSizeInEraAndSlot() const;

   private:
    WindowConfig config_;
  };
}  // namespace exl::window
