/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "window/window_config.hpp"

#include <limits>

#include "common/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(exl::window, WindowConfigError, e) {
  using E = exl::window::WindowConfigError;
  switch (e) {
    case E::kInvalidUnitDuration:
      return "Slot duration must be at least one tick";
    case E::kInvalidSlotsPerEra:
      return "Invalid number of slots per era";
    case E::kInvalidTimeWindow:
      return "Invalid validity window";
    case E::kInvalidBlockTime:
      return "Block time out of supported range";
    case E::kWindowOverflow:
      return "Window configuration overflows tick range";
    default:
      return "Unknown error";
  }
}

namespace exl::window {
  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("window");
      return logger;
    }

    bool mulOverflows(uint64_t a, uint64_t b) {
      return a != 0 && b > std::numeric_limits<uint64_t>::max() / a;
    }
  }  // namespace

  outcome::result<WindowConfig> makeWindowConfig(
      Tick unit_duration,
      uint64_t slots_per_era,
      uint64_t validity_window_slots,
      TransferStamping stamping) {
    if (unit_duration == 0) {
      logger()->warn("rejected window config: zero slot duration");
      return WindowConfigError::kInvalidUnitDuration;
    }
    if (slots_per_era == 0) {
      logger()->warn("rejected window config: zero slots per era");
      return WindowConfigError::kInvalidSlotsPerEra;
    }
    if (validity_window_slots == 0) {
      logger()->warn("rejected window config: zero validity window");
      return WindowConfigError::kInvalidTimeWindow;
    }
    if (validity_window_slots > kMaxValidityWindowSlots
        || mulOverflows(unit_duration, validity_window_slots)
        || mulOverflows(unit_duration, slots_per_era)) {
      logger()->warn(
          "rejected window config: {} ticks per slot, {} slots per era, {} "
          "slots window overflows",
          unit_duration,
          slots_per_era,
          validity_window_slots);
      return WindowConfigError::kWindowOverflow;
    }
    return WindowConfig{.unit_duration = unit_duration,
                        .slots_per_era = slots_per_era,
                        .validity_window_slots = validity_window_slots,
                        .stamping = stamping};
  }

  outcome::result<WindowConfig> windowConfigFromBlockTime(
      uint64_t block_time_ms,
      uint64_t frame_size,
      uint64_t slots_per_era,
      TransferStamping stamping) {
    if (block_time_ms < kMinBlockTimeMs || block_time_ms > kMaxBlockTimeMs) {
      logger()->warn("rejected block time {} ms", block_time_ms);
      return WindowConfigError::kInvalidBlockTime;
    }
    if (frame_size < kMinFrameSize || frame_size > kMaxFrameSize) {
      logger()->warn("rejected frame size {}", frame_size);
      return WindowConfigError::kInvalidTimeWindow;
    }
    if (slots_per_era < kMinSlotsPerEra || slots_per_era > kMaxSlotsPerEra) {
      logger()->warn("rejected slots per era {}", slots_per_era);
      return WindowConfigError::kInvalidSlotsPerEra;
    }
    const auto blocks_per_era{kYearInMilliseconds / block_time_ms};
    const auto blocks_per_slot{blocks_per_era / slots_per_era};
    return makeWindowConfig(blocks_per_slot, slots_per_era, frame_size, stamping);
  }
}  // namespace exl::window
