/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace exl::window {
  using primitives::Tick;

  enum class WindowConfigError {
    kInvalidUnitDuration = 1,
    kInvalidSlotsPerEra,
    kInvalidTimeWindow,
    kInvalidBlockTime,
    kWindowOverflow,
  };

  /**
   * How units moved by transfer are stamped at the receiver
   */
  enum class TransferStamping {
    /// receiver gets the sender's mint slot, expiry clock keeps running
    kPreserveMintSlot,
    /// receiver gets the current slot, value is treated as freshly minted
    kRestampCurrentSlot,
  };

  constexpr uint64_t kMaxValidityWindowSlots{uint64_t{1} << 32};

  // ERC-7818 constructor bounds
  constexpr uint64_t kYearInMilliseconds{31556926000};
  constexpr uint64_t kMinBlockTimeMs{100};
  constexpr uint64_t kMaxBlockTimeMs{600000};
  constexpr uint64_t kMinFrameSize{1};
  constexpr uint64_t kMaxFrameSize{64};
  constexpr uint64_t kMinSlotsPerEra{1};
  constexpr uint64_t kMaxSlotsPerEra{12};

  /**
   * Immutable geometry of the sliding window. Construct with makeWindowConfig
   * or windowConfigFromBlockTime, both validate.
   */
  struct WindowConfig {
    /// ticks per slot
    Tick unit_duration{1};
    uint64_t slots_per_era{1};
    /// slots a minted batch stays spendable, counted from its mint slot
    uint64_t validity_window_slots{1};
    TransferStamping stamping{TransferStamping::kPreserveMintSlot};
  };

  outcome::result<WindowConfig> makeWindowConfig(
      Tick unit_duration,
      uint64_t slots_per_era,
      uint64_t validity_window_slots,
      TransferStamping stamping = TransferStamping::kPreserveMintSlot);

  /**
   * Builds config the way ERC-7818 constructor does: one era lasts a year,
   * slot duration is derived from block time.
   * @param block_time_ms - expected block time, [100, 600000]
   * @param frame_size - validity window in slots, [1, 64]
   * @param slots_per_era - [1, 12]
   */
  outcome::result<WindowConfig> windowConfigFromBlockTime(
      uint64_t block_time_ms,
      uint64_t frame_size,
      uint64_t slots_per_era,
      TransferStamping stamping = TransferStamping::kPreserveMintSlot);
}  // namespace exl::window

OUTCOME_HPP_DECLARE_ERROR(exl::window, WindowConfigError);
