/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "window/sliding_window.hpp"

#include <limits>

namespace exl::window {
  SlidingWindow::SlidingWindow(const WindowConfig &config) : config_{config} {}

  outcome::result<SlidingWindow> SlidingWindow::create(
      const WindowConfig &config) {
    OUTCOME_TRY(validated,
                makeWindowConfig(config.unit_duration,
                                 config.slots_per_era,
                                 config.validity_window_slots,
                                 config.stamping));
    return SlidingWindow{validated};
  }

  const WindowConfig &SlidingWindow::config() const {
    return config_;
  }

  SlotIndex SlidingWindow::slotAt(Tick tick) const {
    return tick / config_.unit_duration;
  }

  SlotIndex SlidingWindow::expirySlot(SlotIndex mint_slot) const {
    constexpr auto kMax{std::numeric_limits<SlotIndex>::max()};
    if (mint_slot > kMax - config_.validity_window_slots) {
      return kMax;
    }
    return mint_slot + config_.validity_window_slots;
  }

  bool SlidingWindow::isExpired(SlotIndex mint_slot, Tick tick) const {
    return isExpiredAtSlot(mint_slot, slotAt(tick));
  }

  bool SlidingWindow::isExpiredAtSlot(SlotIndex mint_slot,
                                      SlotIndex slot) const {
    return slot >= expirySlot(mint_slot);
  }

  SlotIndex SlidingWindow::oldestLiveSlot(SlotIndex slot) const {
    if (slot < config_.validity_window_slots) {
      return 0;
    }
    return slot - config_.validity_window_slots + 1;
  }

  EraAndSlot SlidingWindow::eraAndSlot(SlotIndex slot) const {
    return {slot / config_.slots_per_era, slot % config_.slots_per_era};
  }

  EraAndSlot SlidingWindow::currentEraAndSlot(Tick tick) const {
    return eraAndSlot(slotAt(tick));
  }

  Era SlidingWindow::eraAt(Tick tick) const {
    return slotAt(tick) / config_.slots_per_era;
  }

  SlotIndex SlidingWindow::eraStart(Era era) const {
    if (era > std::numeric_limits<SlotIndex>::max() / config_.slots_per_era) {
      return std::numeric_limits<SlotIndex>::max();
    }
    return era * config_.slots_per_era;
  }

  Frame SlidingWindow::frame(Tick tick) const {
    return frameAtSlot(slotAt(tick));
  }

  Frame SlidingWindow::frameAtSlot(SlotIndex slot) const {
    return {oldestLiveSlot(slot), slot};
  }

  std::pair<EraAndSlot, EraAndSlot> SlidingWindow::frameInEraAndSlot(
      Tick tick) const {
    const auto bounds{frame(tick)};
    return {eraAndSlot(bounds.from), eraAndSlot(bounds.to)};
  }

  Tick SlidingWindow::validityPeriod() const {
    return config_.unit_duration * config_.validity_window_slots;
  }

  Tick SlidingWindow::ticksPerSlot() const {
    return config_.unit_duration;
  }

  Tick SlidingWindow::ticksPerEra() const {
    return config_.unit_duration * config_.slots_per_era;
  }

  EraAndSlot SlidingWindow::frameSizeInEraAndSlot() const {
    const auto window{config_.validity_window_slots};
    if (window <= config_.slots_per_era) {
      return {0, window};
    }
    return {window / config_.slots_per_era, window % config_.slots_per_era};
  }
}  // namespace exl::window
